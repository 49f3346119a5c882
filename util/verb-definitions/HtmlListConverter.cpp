#include "HtmlListConverter.hpp"

namespace
{

// A bare "#" is an item too, an empty one
bool isOrderedItem(const QString& trimmed)
{
	return trimmed.startsWith('#') && !trimmed.startsWith("#:");
}

bool isDescriptionItem(const QString& trimmed)
{
	return trimmed.startsWith("#:");
}

}

QString orderedListToHtml(const QString& line, bool& listOpen)
{
	const auto trimmed = line.trimmed();
	if(isOrderedItem(trimmed))
	{
		const auto text = trimmed.mid(1).trimmed();
		if(text.isEmpty())
		{
			listOpen = false;
			return "";
		}

		QString html;
		if(!listOpen)
		{
			html = "<ol>";
			listOpen = true;
		}
		html += "<li>" + text + "</li>";
		return html;
	}

	// Keep the list open across "#:" lines, which belong to the current item
	if(listOpen && !trimmed.startsWith("#:"))
	{
		listOpen = false;
		return "</ol>" + line;
	}

	return line;
}

QString descriptionListToHtml(const QString& line, bool& descriptionListOpen)
{
	const auto trimmed = line.trimmed();
	if(isDescriptionItem(trimmed))
	{
		const auto text = trimmed.mid(2).trimmed();
		if(text.isEmpty())
		{
			descriptionListOpen = false;
			return "";
		}

		QString html;
		if(!descriptionListOpen)
		{
			html = "<dl>";
			descriptionListOpen = true;
		}
		html += "<dd>" + text + "</dd>";
		return html;
	}

	if(descriptionListOpen)
	{
		descriptionListOpen = false;
		return "</dl>" + line;
	}

	return line;
}

QString convertListsToHtml(const QString& line, ListState& state)
{
	const auto html = orderedListToHtml(line, state.listOpen);
	return descriptionListToHtml(html, state.descriptionListOpen);
}
