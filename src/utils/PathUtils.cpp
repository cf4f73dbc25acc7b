#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QUrl>
#include <QtGlobal>

namespace {

bool isPlaceholderChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

bool lookupVariable(const QString& name, QString* value)
{
    if (name.isEmpty())
        return false;
    const QByteArray nameBytes = name.toUtf8();
    if (!qEnvironmentVariableIsSet(nameBytes.constData()))
        return false;
    *value = qEnvironmentVariable(nameBytes.constData());
    return true;
}

} // namespace

namespace wb::license::utils {

QString expandEnvironmentPlaceholders(const QString& text)
{
    QString result;
    result.reserve(text.size());

    qsizetype index = 0;
    while (index < text.size()) {
        const QChar ch = text.at(index);
        qsizetype end = -1;
        QString name;

        if (ch == QLatin1Char('$') && index + 1 < text.size() && text.at(index + 1) == QLatin1Char('{')) {
            const qsizetype close = text.indexOf(QLatin1Char('}'), index + 2);
            if (close > index + 2) {
                name = text.mid(index + 2, close - index - 2);
                end = close + 1;
            }
        } else if (ch == QLatin1Char('$')) {
            qsizetype cursor = index + 1;
            while (cursor < text.size() && isPlaceholderChar(text.at(cursor)))
                ++cursor;
            if (cursor > index + 1) {
                name = text.mid(index + 1, cursor - index - 1);
                end = cursor;
            }
        } else if (ch == QLatin1Char('%')) {
            const qsizetype close = text.indexOf(QLatin1Char('%'), index + 1);
            if (close > index + 1) {
                name = text.mid(index + 1, close - index - 1);
                end = close + 1;
            }
        }

        if (end < 0) {
            result.append(ch);
            ++index;
            continue;
        }

        QString value;
        if (lookupVariable(name, &value))
            result.append(value);
        else
            result.append(text.mid(index, end - index));
        index = end;
    }

    return result;
}

QString expandPath(const QString& path)
{
    if (path.trimmed().isEmpty())
        return {};

    QString expanded = expandEnvironmentPlaceholders(path.trimmed());

    if (expanded.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive)) {
        const QUrl url(expanded);
        if (url.isValid() && url.isLocalFile())
            expanded = url.toLocalFile();
    }

    if (expanded == QStringLiteral("~"))
        expanded = QDir::homePath();
    else if (expanded.startsWith(QStringLiteral("~/")))
        expanded = QDir::homePath() + expanded.mid(1);

    QFileInfo info(expanded);
    if (!info.isAbsolute())
        expanded = QDir::current().absoluteFilePath(expanded);

    return QDir::cleanPath(expanded);
}

QString defaultDataDirectory()
{
    QString location = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (location.isEmpty())
        location = QDir::home().absoluteFilePath(QStringLiteral(".water-balance"));
    return QDir(location).absoluteFilePath(QStringLiteral("license"));
}

QString resolveInDirectory(const QString& directory, const QString& fileName)
{
    const QString expanded = expandEnvironmentPlaceholders(fileName.trimmed());
    if (expanded.isEmpty())
        return {};
    if (QFileInfo(expanded).isAbsolute() || expanded.startsWith(QLatin1Char('~')))
        return expandPath(expanded);
    return QDir::cleanPath(QDir(expandPath(directory)).absoluteFilePath(expanded));
}

bool ensureParentDirectory(const QString& filePath, QString* errorMessage)
{
    const QDir dir = QFileInfo(filePath).dir();
    if (dir.exists())
        return true;
    if (QDir().mkpath(dir.absolutePath()))
        return true;
    if (errorMessage)
        *errorMessage = QStringLiteral("cannot create directory %1").arg(dir.absolutePath());
    return false;
}

} // namespace wb::license::utils
