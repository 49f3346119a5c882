#include <iostream>
#include <QDir>
#include <QLoggingCategory>

#include "InfinitiveList.hpp"
#include "ExtractorSettings.hpp"
#include "DefinitionsBuilder.hpp"
#include "WiktionaryDumpReader.hpp"

int main(int argc, char** argv)
{
	if (argc != 4 && argc != 5)
	{
		std::cerr << "Usage: " << argv[0] << " dumpFile infinitivesFile outputDir [settings.ini]\n";
		return 1;
	}

	ExtractorSettings settings;
	if(!settings.setPaths(QString::fromLocal8Bit(argv[1]), QString::fromLocal8Bit(argv[2]), QString::fromLocal8Bit(argv[3])))
		return 1;
	if(argc == 5 && !settings.load(QString::fromLocal8Bit(argv[4])))
		return 1;

	QLoggingCategory::setFilterRules(settings.debugLogging ? "*.debug=true" : "*.debug=false");

	InfinitiveList infinitives;
	if(!infinitives.load(settings.infinitivesPath))
		return 1;
	std::cerr << "Read " << infinitives.size() << " infinitives\n";

	DefinitionsBuilder builder(infinitives);
	builder.setVerbMarker(settings.verbMarker);
	builder.getExtractor().setAlternativeFormLink(settings.alternativeFormLink);

	WiktionaryDumpReader reader;
	std::cerr << "Extracting definitions from " << QDir::toNativeSeparators(settings.dumpPath).toStdString() << "...\n";
	if(!reader.read(settings.dumpPath, [&builder](const WikiPage& page) { builder.addPage(page); }))
		return 1;

	if(!builder.dump(settings.outputDir))
		return 1;

	const auto report = builder.report();
	std::cout << "Definitions: " << report.defined << "\n";
	std::cout << "Without Definitions: " << report.undefined << "\n";
}
