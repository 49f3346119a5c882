#pragma once

#include <QSet>
#include <QString>

//! Extracts the "Verb" section of a Wiktionary page as a small HTML fragment.
class VerbSectionExtractor
{
	QString alternativeFormLink = "/conjugador-de-verbs/verb/%1";

	QString alternativeFormParagraph(const QString& infinitive) const;
public:
	//! Pattern of the link to the page of an alternative form, %1 being the infinitive
	void setAlternativeFormLink(const QString& link) { alternativeFormLink = link; }
	const QString& getAlternativeFormLink() const { return alternativeFormLink; }

	/**
	 * @brief Builds the description of the verb defined in revisionText.
	 *
	 * The body of the ===Verb=== section, up to the next heading or to the first
	 * {{-...-}} section marker, is stripped of wiki markup and its numbered
	 * lists are turned into <ol> and <dl> lists. When the section refers to an
	 * alternative form that is one of @p infinitives, a paragraph linking to it
	 * is appended.
	 *
	 * @return The description, or an empty string if there is none.
	 */
	QString extract(const QString& revisionText, const QSet<QString>& infinitives) const;
};
