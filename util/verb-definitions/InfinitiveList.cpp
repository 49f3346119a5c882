#include "InfinitiveList.hpp"

#include <QDir>
#include <QFile>
#include <QDebug>
#include <QRegularExpression>

void InfinitiveList::add(const QString& word)
{
	static const QRegularExpression wordPattern("^[a-zàèéíïòóúüç·'-]+$");

	const auto infinitive = word.trimmed().toLower();
	if(infinitive.isEmpty())
		return;
	if(!wordPattern.match(infinitive).hasMatch())
		qWarning().noquote() << "Unexpected characters in infinitive" << infinitive;

	infinitives.push_back(infinitive);
	lookup.insert(infinitive);
}

bool InfinitiveList::load(const QString& path)
{
	QFile file(path);
	if(!file.open(QIODevice::ReadOnly | QIODevice::Text))
	{
		qCritical().noquote() << "Failed to open infinitives file" << QDir::toNativeSeparators(path)
		                      << ":" << file.errorString();
		return false;
	}

	infinitives.clear();
	lookup.clear();
	while(!file.atEnd())
		add(QString::fromUtf8(file.readLine()));

	if(infinitives.empty())
		qWarning().noquote() << "No infinitives found in" << QDir::toNativeSeparators(path);
	else
		qDebug().noquote() << "Loaded" << infinitives.size() << "infinitives";

	return true;
}

void InfinitiveList::setInfinitives(const std::vector<QString>& words)
{
	infinitives.clear();
	lookup.clear();
	for(const auto& word : words)
		add(word);
}
