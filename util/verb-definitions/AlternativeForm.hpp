#pragma once

#include <optional>
#include <QString>

//! Returns WORD from a {{forma-a|ca|WORD}} template found in rawLine.
//! Only Catalan lowercase words are accepted. The line must not have gone
//! through removeTemplates() yet, since that would remove the template.
[[nodiscard]] std::optional<QString> findAlternativeForm(const QString& rawLine);
