#pragma once

#include <QString>
#include <QStringList>

namespace huesync {

// Minimal dotenv style KEY=value file. Comments, blank lines and unknown
// keys are preserved when the file is written back.
class EnvFile
{
public:
    explicit EnvFile(const QString &path = QString());

    // A missing file loads as empty.
    bool load(QString *error = nullptr);
    bool save(QString *error = nullptr) const;

    QString value(const QString &key, const QString &defaultValue = QString()) const;
    bool contains(const QString &key) const;
    void setValue(const QString &key, const QString &value);

    QString path() const { return m_path; }
    QStringList keys() const;

    static QString defaultPath();

private:
    int indexOf(const QString &key) const;

    QString m_path;
    QStringList m_lines;
};

} // namespace huesync
