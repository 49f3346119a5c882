#include "DefinitionsBuilder.hpp"

#include <QDir>
#include <QFile>
#include <QDebug>
#include <QJsonObject>
#include <QJsonDocument>

#include "InfinitiveList.hpp"
#include "WiktionaryDumpReader.hpp"

DefinitionsBuilder::DefinitionsBuilder(const InfinitiveList& infinitives)
	: infinitives(infinitives)
{
}

QString DefinitionsBuilder::canonicalKey(const QString& title)
{
	// Wiktionary titles reflexive verbs with the pronoun, e.g. apoltronar-se
	auto key = title.toLower().trimmed();
	if(key.endsWith("'s"))
		key.chop(2);
	else if(key.endsWith("-se"))
		key.chop(3);
	return key;
}

bool DefinitionsBuilder::addPage(const WikiPage& page)
{
	const auto verb = canonicalKey(page.title);
	if(!infinitives.contains(verb))
	{
		qDebug().noquote() << "Discard not in word list:" << page.title;
		return false;
	}

	if(!page.text.contains(verbMarker))
	{
		qDebug().noquote() << "Discard is not a verb:" << page.title;
		return false;
	}

	const auto description = extractor.extract(page.text, infinitives.set());
	if(description.isEmpty())
	{
		qDebug().noquote() << "Discard no description:" << page.title;
		return false;
	}

	qDebug().noquote() << "Store" << verb << "-" << description;
	definitions[verb] = description;
	return true;
}

DefinitionsBuilder::Report DefinitionsBuilder::report() const
{
	Report report;
	for(const auto& verb : infinitives.words())
	{
		if(definitions.contains(verb))
		{
			++report.defined;
		}
		else
		{
			++report.undefined;
			qDebug().noquote() << "No def for:" << verb;
		}
	}
	return report;
}

bool DefinitionsBuilder::dumpText(const QString& outDir) const
{
	const auto path = outDir + "/definitions.txt";
	QFile file(path);
	if(!file.open(QFile::WriteOnly | QFile::Text))
	{
		qCritical().noquote() << "Failed to open file" << path << ":" << file.errorString();
		return false;
	}

	QByteArray contents;
	for(const auto& verb : infinitives.words())
	{
		const auto it = definitions.constFind(verb);
		if(it == definitions.constEnd())
			continue;

		contents += verb.toUtf8() + '\n';
		contents += it.value().toUtf8() + '\n';
	}

	if(file.write(contents) < 0 || !file.flush())
	{
		qCritical().noquote() << "Failed to write" << path << ":" << file.errorString();
		return false;
	}
	return true;
}

bool DefinitionsBuilder::dumpJSON(const QString& outDir) const
{
	QJsonObject object;
	for(auto it = definitions.constBegin(); it != definitions.constEnd(); ++it)
		object.insert(it.key(), it.value());

	const auto path = outDir + "/definitions.json";
	QFile file(path);
	if(!file.open(QFile::WriteOnly))
	{
		qCritical().noquote() << "Failed to open file" << path << ":" << file.errorString();
		return false;
	}

	if(file.write(QJsonDocument(object).toJson(QJsonDocument::Compact)) < 0 || !file.flush())
	{
		qCritical().noquote() << "Failed to write" << path << ":" << file.errorString();
		return false;
	}
	return true;
}

bool DefinitionsBuilder::dump(const QString& outDir) const
{
	if(!QDir().mkpath(outDir))
	{
		qCritical().noquote() << "Failed to create output directory" << QDir::toNativeSeparators(outDir);
		return false;
	}

	return dumpText(outDir) && dumpJSON(outDir);
}
