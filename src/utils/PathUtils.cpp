#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QtGlobal>

namespace {

bool isVariableChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

QString lookupVariable(const QString& name, const QString& verbatim)
{
    const QByteArray nameBytes = name.toUtf8();
    if (name.isEmpty() || !qEnvironmentVariableIsSet(nameBytes.constData())) {
        return verbatim;
    }
    return qEnvironmentVariable(nameBytes.constData());
}

} // namespace

namespace marketbrief::utils {

QString expandEnvironmentPlaceholders(const QString& text)
{
    QString result;
    result.reserve(text.size());

    int index = 0;
    while (index < text.size()) {
        if (text.at(index) != QLatin1Char('$') || index + 1 >= text.size()) {
            result.append(text.at(index));
            ++index;
            continue;
        }

        if (text.at(index + 1) == QLatin1Char('{')) {
            const int end = text.indexOf(QLatin1Char('}'), index + 2);
            if (end > index + 2) {
                result.append(lookupVariable(text.mid(index + 2, end - index - 2), text.mid(index, end - index + 1)));
                index = end + 1;
                continue;
            }
        } else {
            int end = index + 1;
            while (end < text.size() && isVariableChar(text.at(end)))
                ++end;
            if (end > index + 1) {
                result.append(lookupVariable(text.mid(index + 1, end - index - 1), text.mid(index, end - index)));
                index = end;
                continue;
            }
        }

        result.append(text.at(index));
        ++index;
    }
    return result;
}

QString expandPath(const QString& path)
{
    if (path.trimmed().isEmpty())
        return {};

    QString expanded = expandEnvironmentPlaceholders(path.trimmed());
    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    if (!QFileInfo(expanded).isAbsolute())
        expanded = QDir::current().absoluteFilePath(expanded);

    return QDir::cleanPath(expanded);
}

} // namespace marketbrief::utils
