#include "WikiMarkup.hpp"

#include <QDebug>
#include <QRegularExpression>

namespace
{

// Finds the first balanced template in line. Returns false if there is none,
// or if the markup around it is unbalanced.
bool findTemplate(const QString& line, int& startPos, int& endPos)
{
	const QString templateStart = "{{";
	const QString templateEnd = "}}";

	startPos = -1;
	endPos = -1;
	int depth = 0;
	int pos = 0;
	for(;;)
	{
		const int start = line.indexOf(templateStart, pos);
		const int end = line.indexOf(templateEnd, pos);
		if(start < 0 && end < 0)
			break;

		if(start >= 0 && (end < 0 || start < end))
		{
			if(startPos < 0)
				startPos = start;
			++depth;
			pos = start + templateStart.size();
		}
		else
		{
			if(depth == 0)
				return false; // "}}" without a matching "{{"
			--depth;
			pos = end + templateEnd.size();
			if(depth == 0)
			{
				endPos = pos;
				return true;
			}
		}
	}

	return false;
}

}

QString removeGallerySections(const QString& text)
{
	const QString sectionStart = "<gallery>";
	const QString sectionEnd = "</gallery>";

	const int start = text.indexOf(sectionStart);
	if(start < 0)
		return text;

	const int end = text.indexOf(sectionEnd, start);
	if(end < 0)
		return text;

	return text.left(start) + text.mid(end + sectionEnd.size());
}

QString removeTemplates(const QString& line)
{
	QString result = line;
	int startPos, endPos;
	while(findTemplate(result, startPos, endPos))
		result.remove(startPos, endPos - startPos);
	return result;
}

QString removeInternalLinks(const QString& line)
{
	const QString linkStart = "[[";
	const QString linkEnd = "]]";

	QString result = line;
	for(;;)
	{
		const int start = result.indexOf(linkStart);
		if(start < 0)
			break;

		const int end = result.indexOf(linkEnd, start);
		if(end < 0)
			break;

		const int textStart = start + linkStart.size();
		auto text = result.mid(textStart, end - textStart);
		const int separator = text.lastIndexOf('|');
		if(separator >= 0)
			text = text.mid(separator + 1);

		const auto before = result;
		result = result.left(start) + text + result.mid(end + linkEnd.size());
		qDebug().noquote() << "Removed link" << before.trimmed() << "->" << result.trimmed();
	}
	return result;
}

QString removeWikiEmphasis(const QString& line)
{
	QString result = line;
	result.remove("'''");
	result.remove("''");
	return result;
}

QString removeXmlTags(const QString& line)
{
	// Replace the italics that we produce with placeholders that don't look
	// like tags, so that the generic tag removal below leaves them alone.
	const QString italicOpenPlaceholder = "[5b0f3c4e-8d2a-4a57-9a61-3f0e2cd7b1a4]";
	const QString italicClosePlaceholder = "[e1c9a2d6-71f4-4c0b-b8e5-0d9f6a3c5e27]";

	static const QRegularExpression refPattern("<ref>(.*)</ref>");
	static const QRegularExpression tagPattern("<[^>]*>");

	QString result = line;
	result.replace(refPattern, " " + italicOpenPlaceholder + "\\1" + italicClosePlaceholder);
	result.replace(tagPattern, "");
	result.replace(italicOpenPlaceholder, "<i>");
	result.replace(italicClosePlaceholder, "</i>");
	return result;
}
