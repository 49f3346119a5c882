#pragma once

#include <QHash>
#include <QString>

#include "VerbSectionExtractor.hpp"

class InfinitiveList;
struct WikiPage;

//! Collects the definitions of the verbs of an InfinitiveList from Wiktionary pages.
class DefinitionsBuilder
{
	const InfinitiveList& infinitives;
	VerbSectionExtractor extractor;
	QString verbMarker = "{{ca-verb";
	// A later page with the same key replaces the earlier one
	QHash<QString, QString> definitions;

	bool dumpText(const QString& outDir) const;
	bool dumpJSON(const QString& outDir) const;
public:
	struct Report
	{
		int defined = 0;
		int undefined = 0;
	};

	explicit DefinitionsBuilder(const InfinitiveList& infinitives);

	//! Page title in lower case, without the reflexive pronoun ("-se" or "'s")
	static QString canonicalKey(const QString& title);

	void setVerbMarker(const QString& marker) { verbMarker = marker; }
	VerbSectionExtractor& getExtractor() { return extractor; }

	bool addPage(const WikiPage& page);

	const QHash<QString, QString>& getDefinitions() const { return definitions; }
	Report report() const;

	bool dump(const QString& outDir) const;
};
