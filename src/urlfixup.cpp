#include "urlfixup.h"
#include <QUrl>

namespace vrt {

// ── Location-bar input ────────────────────────────────────────────────
//
// Tried in order, first match wins:
//   "data:text/html,a"      → kept (has a scheme)
//   "/dev/null"             → file:///dev/null
//   "nic.md", "foo/bar"     → https://nic.md/, https://foo/bar
//   "3.5 kg in lb"          → search page, term percent-encoded
//
// An empty (or all-space) request is rejected.

static QString finish(QUrl url) {
    if (url.path().isEmpty() && !url.host().isEmpty())
        url.setPath(QStringLiteral("/"));
    return url.toString(QUrl::FullyEncoded);
}

static bool tryWithScheme(const QString& request, UrlFixupResult& out) {
    QUrl url(request, QUrl::StrictMode);
    if (!url.isValid() || url.scheme().isEmpty())
        return false;
    out.ok  = true;
    out.url = finish(url);
    return true;
}

static bool tryAsFile(const QString& request, UrlFixupResult& out) {
    if (!request.startsWith(QLatin1Char('/')))
        return false;
    QUrl url = QUrl::fromLocalFile(request);
    if (!url.isValid())
        return false;
    out.ok  = true;
    out.url = url.toString(QUrl::FullyEncoded);
    return true;
}

static bool tryAsDomain(const QString& request, UrlFixupResult& out) {
    if (!UrlFixup::isDomainLike(request))
        return false;
    QUrl url(QStringLiteral("https://") + request, QUrl::TolerantMode);
    if (!url.isValid() || url.host().isEmpty())
        return false;
    out.ok  = true;
    out.url = finish(url);
    return true;
}

static bool tryAsSearch(const QString& request, const QString& searchPage, UrlFixupResult& out) {
    if (request.isEmpty() || searchPage.isEmpty())
        return false;
    QString term = QString::fromLatin1(QUrl::toPercentEncoding(request));
    QString target = searchPage;
    target.replace(QStringLiteral("%s"), term);
    QUrl url(target, QUrl::TolerantMode);
    if (!url.isValid())
        return false;
    out.ok  = true;
    out.url = url.toString(QUrl::FullyEncoded);
    return true;
}

bool UrlFixup::isDomainLike(const QString& s) {
    const bool hasSpace = s.contains(QLatin1Char(' '));
    const bool pathLike = !s.startsWith(QLatin1Char('/')) && s.contains(QLatin1Char('/'));
    const bool dotted   = !hasSpace && !s.startsWith(QLatin1Char('.'))
                          && s.split(QLatin1Char('.')).size() > 1;
    return (pathLike && !hasSpace) || dotted;
}

UrlFixupResult UrlFixup::fromUserInput(const QString& input, const QString& searchPage) {
    UrlFixupResult r;
    const QString request = input.trimmed();
    if (request.isEmpty()) {
        r.error = QStringLiteral("empty input");
        return r;
    }
    if (tryWithScheme(request, r)) return r;
    if (tryAsFile(request, r))     return r;
    if (tryAsDomain(request, r))   return r;
    if (tryAsSearch(request, searchPage, r)) return r;
    r.error = QStringLiteral("cannot interpret '%1' as a URL").arg(request);
    return r;
}

} // namespace vrt
