#include "AlternativeForm.hpp"

#include <QRegularExpression>

std::optional<QString> findAlternativeForm(const QString& rawLine)
{
	// The leading greedy .* makes the last template on the line win
	static const QRegularExpression formPattern(R"reg(.*\{\{forma-a\|ca\|([a-zàéèíóòú·ç]*)\}\})reg");

	const auto match = formPattern.match(rawLine);
	if(!match.hasMatch())
		return std::nullopt;

	const auto word = match.captured(1);
	if(word.isEmpty())
		return std::nullopt;
	return word;
}
