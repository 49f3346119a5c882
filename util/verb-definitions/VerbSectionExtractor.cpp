#include "VerbSectionExtractor.hpp"

#include <optional>
#include <vector>
#include <QDebug>
#include <QRegularExpression>

#include "WikiMarkup.hpp"
#include "AlternativeForm.hpp"
#include "HtmlListConverter.hpp"

namespace
{

// Splits text into lines, keeping the '\n' at the end of each one
std::vector<QString> splitKeepingNewlines(const QString& text)
{
	std::vector<QString> lines;
	int pos = 0;
	while(pos < text.size())
	{
		const int newline = text.indexOf('\n', pos);
		const int next = newline < 0 ? text.size() : newline + 1;
		lines.push_back(text.mid(pos, next - pos));
		pos = next;
	}
	return lines;
}

bool hasText(const QString& line)
{
	static const QRegularExpression letterPattern("[a-zA-Z]");
	return line.contains(letterPattern);
}

QString findVerbSection(const QString& revisionText)
{
	static const QRegularExpression headingPattern("===[ \t]*Verb[ \t]*===");

	const auto match = headingPattern.match(revisionText);
	if(!match.hasMatch())
		return "";

	const int start = match.capturedEnd(0);
	const int end = revisionText.indexOf("==", start);
	if(end < 0)
		return "";

	return revisionText.mid(start, end - start);
}

}

QString VerbSectionExtractor::alternativeFormParagraph(const QString& infinitive) const
{
	const auto link = QString(alternativeFormLink).arg(infinitive);
	return QString("<p style='font-weight: 300'>Forma alternativa a <a href='%1'>%2</a></p>").arg(link, infinitive);
}

QString VerbSectionExtractor::extract(const QString& revisionText, const QSet<QString>& infinitives) const
{
	const auto section = removeGallerySections(findVerbSection(revisionText));
	if(section.isEmpty())
		return "";

	QString description;
	ListState lists;
	std::optional<QString> alternative;
	for(const auto& rawLine : splitKeepingNewlines(section))
	{
		// {{-sin-}}, {{-trad-}} and the like start sections we don't want
		if(rawLine.toLower().contains("{{-"))
			break;

		if(!alternative)
			alternative = findAlternativeForm(rawLine);

		auto line = removeTemplates(rawLine);
		line = removeInternalLinks(line);
		line = removeWikiEmphasis(line);
		line = removeXmlTags(line);
		line = convertListsToHtml(line, lists);

		if(!hasText(line))
		{
			qDebug().noquote() << "Discard:" << line;
			continue;
		}

		description += line;
	}

	if(alternative)
	{
		if(infinitives.contains(*alternative))
			description += alternativeFormParagraph(*alternative);
		else
			qDebug().noquote() << "Alternative" << *alternative << "not in infinitives";
	}

	return description;
}
