#include "WiktionaryDumpReader.hpp"

#include <QDir>
#include <QFile>
#include <QDebug>
#include <QXmlStreamReader>

QString WiktionaryDumpReader::readRevisionText(QXmlStreamReader& xml) const
{
	QString text;
	while(xml.readNextStartElement())
	{
		if(xml.name() == QLatin1String("text"))
			text = xml.readElementText();
		else
			xml.skipCurrentElement();
	}
	return text;
}

WikiPage WiktionaryDumpReader::readPage(QXmlStreamReader& xml) const
{
	WikiPage page;
	while(xml.readNextStartElement())
	{
		if(xml.name() == QLatin1String("title"))
			page.title = xml.readElementText();
		else if(xml.name() == QLatin1String("revision"))
			page.text = readRevisionText(xml);
		else
			xml.skipCurrentElement();
	}
	return page;
}

bool WiktionaryDumpReader::read(QIODevice& device, const PageVisitor& visit)
{
	pageCount = 0;
	QXmlStreamReader xml(&device);

	// <mediawiki> holds <siteinfo> followed by the <page> elements
	if(xml.readNextStartElement())
	{
		while(xml.readNextStartElement())
		{
			if(xml.name() == QLatin1String("page"))
			{
				const auto page = readPage(xml);
				if(xml.hasError())
					break;
				++pageCount;
				visit(page);
			}
			else
			{
				xml.skipCurrentElement();
			}
		}
	}

	if(xml.hasError())
	{
		qCritical().nospace().noquote() << "XML error at line " << xml.lineNumber() << ", column "
		                                << xml.columnNumber() << ": " << xml.errorString();
		return false;
	}
	return true;
}

bool WiktionaryDumpReader::read(const QString& path, const PageVisitor& visit)
{
	QFile file(path);
	if(!file.open(QIODevice::ReadOnly))
	{
		qCritical().noquote() << "Failed to open dump file" << QDir::toNativeSeparators(path)
		                      << ":" << file.errorString();
		return false;
	}

	if(!read(file, visit))
	{
		qCritical().noquote() << "Failed to read dump file" << QDir::toNativeSeparators(path);
		return false;
	}

	qDebug().noquote() << "Read" << pageCount << "pages from" << QDir::toNativeSeparators(path);
	return true;
}
