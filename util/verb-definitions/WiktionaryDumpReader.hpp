#pragma once

#include <functional>
#include <QString>

class QIODevice;
class QXmlStreamReader;

struct WikiPage
{
	QString title;
	QString text; //!< Wikitext of the last revision
};

//! Streams the pages of a MediaWiki XML export (pages-meta-current dumps).
class WiktionaryDumpReader
{
	int pageCount = 0;

	WikiPage readPage(QXmlStreamReader& xml) const;
	QString readRevisionText(QXmlStreamReader& xml) const;
public:
	using PageVisitor = std::function<void(const WikiPage&)>;

	bool read(const QString& path, const PageVisitor& visit);
	bool read(QIODevice& device, const PageVisitor& visit);

	int getPageCount() const { return pageCount; }
};
