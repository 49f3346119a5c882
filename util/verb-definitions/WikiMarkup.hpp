#pragma once

#include <QString>

// Each function strips one kind of MediaWiki markup from a line of text.
// They never fail: markup they don't understand is left as is.

//! Only the first <gallery> block is removed
[[nodiscard]] QString removeGallerySections(const QString& text);

[[nodiscard]] QString removeTemplates(const QString& line);

[[nodiscard]] QString removeInternalLinks(const QString& line);

[[nodiscard]] QString removeWikiEmphasis(const QString& line);

//! <ref>x</ref> becomes " <i>x</i>"
[[nodiscard]] QString removeXmlTags(const QString& line);
