#pragma once

#include <QString>

// Use a fresh state for every section
struct ListState
{
	bool listOpen = false;
	bool descriptionListOpen = false;
};

[[nodiscard]] QString orderedListToHtml(const QString& line, bool& listOpen);
[[nodiscard]] QString descriptionListToHtml(const QString& line, bool& descriptionListOpen);

//! Lists still open after the last line of a section are not closed.
[[nodiscard]] QString convertListsToHtml(const QString& line, ListState& state);
