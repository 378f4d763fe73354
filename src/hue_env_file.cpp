#include "hue_env_file.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QTextStream>

namespace huesync {

namespace {

// Splits "KEY=value" (optionally "export KEY=value"); false for comments.
bool splitLine(const QString &line, QString *key, QString *value)
{
    QString trimmed = line.trimmed();
    if (trimmed.isEmpty() || trimmed.startsWith(QLatin1Char('#')))
        return false;
    if (trimmed.startsWith(QLatin1String("export ")))
        trimmed = trimmed.mid(7).trimmed();

    const int eq = trimmed.indexOf(QLatin1Char('='));
    if (eq <= 0)
        return false;

    if (key)
        *key = trimmed.left(eq).trimmed();
    if (value) {
        QString v = trimmed.mid(eq + 1).trimmed();
        if (v.size() >= 2
            && ((v.startsWith(QLatin1Char('"')) && v.endsWith(QLatin1Char('"')))
                || (v.startsWith(QLatin1Char('\'')) && v.endsWith(QLatin1Char('\''))))) {
            v = v.mid(1, v.size() - 2);
        }
        *value = v;
    }
    return true;
}

} // namespace

EnvFile::EnvFile(const QString &path)
    : m_path(path.isEmpty() ? defaultPath() : path)
{
}

QString EnvFile::defaultPath()
{
    return QDir::current().filePath(QStringLiteral(".env"));
}

bool EnvFile::load(QString *error)
{
    m_lines.clear();
    QFile file(m_path);
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (error)
            *error = QStringLiteral("Cannot read %1: %2").arg(m_path, file.errorString());
        return false;
    }
    QTextStream in(&file);
    while (!in.atEnd())
        m_lines.append(in.readLine());
    return true;
}

bool EnvFile::save(QString *error) const
{
    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        if (error)
            *error = QStringLiteral("Cannot write %1: %2").arg(m_path, file.errorString());
        return false;
    }
    QTextStream out(&file);
    for (const QString &line : m_lines)
        out << line << '\n';
    out.flush();
    if (!file.commit()) {
        if (error)
            *error = QStringLiteral("Cannot write %1: %2").arg(m_path, file.errorString());
        return false;
    }
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return true;
}

int EnvFile::indexOf(const QString &key) const
{
    for (int i = m_lines.size() - 1; i >= 0; --i) {
        QString lineKey;
        if (splitLine(m_lines.at(i), &lineKey, nullptr) && lineKey == key)
            return i;
    }
    return -1;
}

QString EnvFile::value(const QString &key, const QString &defaultValue) const
{
    const int index = indexOf(key);
    if (index < 0)
        return defaultValue;
    QString value;
    splitLine(m_lines.at(index), nullptr, &value);
    return value;
}

bool EnvFile::contains(const QString &key) const
{
    return indexOf(key) >= 0;
}

void EnvFile::setValue(const QString &key, const QString &value)
{
    QString encoded = value;
    if (encoded.contains(QLatin1Char(' ')) || encoded.contains(QLatin1Char('#')))
        encoded = QLatin1Char('"') + encoded + QLatin1Char('"');
    const QString line = key + QLatin1Char('=') + encoded;

    const int index = indexOf(key);
    if (index >= 0)
        m_lines[index] = line;
    else
        m_lines.append(line);
}

QStringList EnvFile::keys() const
{
    QStringList out;
    for (const QString &line : m_lines) {
        QString key;
        if (splitLine(line, &key, nullptr) && !out.contains(key))
            out.append(key);
    }
    return out;
}

} // namespace huesync
