#pragma once
#include <QString>

namespace vrt {

struct UrlFixupResult {
    bool    ok = false;
    QString url;      // fully encoded
    QString error;
};

class UrlFixup {
public:
    // Interprets location-bar input: a URL with a scheme is kept, an
    // absolute path becomes a file URL, domain-like input gets https://,
    // anything else becomes a query on `searchPage` (with %s standing in
    // for the search term).
    static UrlFixupResult fromUserInput(const QString& input, const QString& searchPage);

    static bool isDomainLike(const QString& text);
};

} // namespace vrt
