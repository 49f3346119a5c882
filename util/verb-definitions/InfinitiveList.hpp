#pragma once

#include <vector>
#include <QSet>
#include <QString>

//! Lower-cased, in the order of the source file
class InfinitiveList
{
	std::vector<QString> infinitives;
	QSet<QString> lookup;

	void add(const QString& word);
public:
	bool load(const QString& path);
	void setInfinitives(const std::vector<QString>& words);

	bool contains(const QString& word) const { return lookup.contains(word); }
	const std::vector<QString>& words() const { return infinitives; }
	const QSet<QString>& set() const { return lookup; }
	size_t size() const { return infinitives.size(); }
};
