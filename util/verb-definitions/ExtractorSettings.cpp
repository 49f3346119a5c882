#include "ExtractorSettings.hpp"

#include <QDir>
#include <QDebug>
#include <QFileInfo>
#include <QSettings>

bool ExtractorSettings::setPaths(const QString& dump, const QString& infinitives, const QString& outDir)
{
	const QFileInfo outInfo(outDir);
	if(outInfo.exists() && !outInfo.isDir())
	{
		qCritical().noquote() << "Output path" << QDir::toNativeSeparators(outDir) << "exists and is not a directory";
		return false;
	}

	const auto outPath = QDir::cleanPath(outInfo.absoluteFilePath());
	for(const auto& input : {dump, infinitives})
	{
		if(QDir::cleanPath(QFileInfo(input).absoluteFilePath()) == outPath)
		{
			qCritical().noquote() << "Input file" << QDir::toNativeSeparators(input) << "and output directory must be different";
			return false;
		}
	}

	dumpPath = dump;
	infinitivesPath = infinitives;
	outputDir = outDir;
	return true;
}

bool ExtractorSettings::load(const QString& path)
{
	if(!QFileInfo(path).isReadable())
	{
		qCritical().noquote() << "Settings file" << QDir::toNativeSeparators(path) << "can't be read";
		return false;
	}

	QSettings settings(path, QSettings::IniFormat);
	if(settings.status() != QSettings::NoError)
	{
		qCritical().noquote() << "Malformed settings file" << QDir::toNativeSeparators(path);
		return false;
	}

	verbMarker = settings.value("extraction/verbMarker", verbMarker).toString();
	alternativeFormLink = settings.value("extraction/alternativeFormLink", alternativeFormLink).toString();
	debugLogging = settings.value("logging/debug", debugLogging).toBool();

	if(verbMarker.isEmpty())
	{
		qCritical() << "extraction/verbMarker must not be empty";
		return false;
	}
	if(!alternativeFormLink.contains("%1"))
		qWarning().noquote() << "extraction/alternativeFormLink has no %1, links will not name the verb";

	return true;
}
