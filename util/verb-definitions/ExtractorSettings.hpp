#pragma once

#include <QString>

struct ExtractorSettings
{
	QString dumpPath;
	QString infinitivesPath;
	QString outputDir;

	QString verbMarker = "{{ca-verb";
	QString alternativeFormLink = "/conjugador-de-verbs/verb/%1";
	bool debugLogging = false;

	//! Rejects an output path that is a file or that names one of the input files
	bool setPaths(const QString& dump, const QString& infinitives, const QString& outDir);
	bool load(const QString& path);
};
