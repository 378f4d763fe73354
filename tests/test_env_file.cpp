#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "hue_env_file.h"

using namespace huesync;

namespace {

void writeFile(const QString &path, const QByteArray &contents)
{
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(contents);
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return QByteArray();
    return file.readAll();
}

} // namespace

class EnvFileTest : public ::testing::Test
{
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    QString envPath() const { return dir.filePath(QStringLiteral(".env")); }

    QTemporaryDir dir;
};

TEST_F(EnvFileTest, MissingFileLoadsEmpty)
{
    EnvFile env(envPath());
    QString error;
    ASSERT_TRUE(env.load(&error)) << error.toStdString();
    EXPECT_TRUE(env.keys().isEmpty());
    EXPECT_EQ(env.value(QStringLiteral("HUE_USER"), QStringLiteral("fallback")), QStringLiteral("fallback"));
}

TEST_F(EnvFileTest, StoredKeyIsReadBack)
{
    {
        EnvFile env(envPath());
        ASSERT_TRUE(env.load());
        env.setValue(QStringLiteral("HUE_USER"), QStringLiteral("abc123"));
        QString error;
        ASSERT_TRUE(env.save(&error)) << error.toStdString();
    }

    EnvFile reloaded(envPath());
    ASSERT_TRUE(reloaded.load());
    EXPECT_TRUE(reloaded.contains(QStringLiteral("HUE_USER")));
    EXPECT_EQ(reloaded.value(QStringLiteral("HUE_USER")), QStringLiteral("abc123"));

    const QFileDevice::Permissions permissions = QFile::permissions(envPath());
    EXPECT_TRUE(permissions & QFileDevice::ReadOwner);
    EXPECT_FALSE(permissions & QFileDevice::ReadOther);
}

TEST_F(EnvFileTest, UpdatePreservesCommentsAndOtherKeys)
{
    writeFile(envPath(), "# bridge settings\nOTHER=1\n\nHUE_USER=old\n");

    EnvFile env(envPath());
    ASSERT_TRUE(env.load());
    env.setValue(QStringLiteral("HUE_USER"), QStringLiteral("new"));
    ASSERT_TRUE(env.save());

    EXPECT_EQ(readFile(envPath()), QByteArray("# bridge settings\nOTHER=1\n\nHUE_USER=new\n"));
}

TEST_F(EnvFileTest, ParsesQuotesExportAndLastAssignment)
{
    writeFile(envPath(),
              "export HUE_BRIDGE_HOST=192.168.1.2\n"
              "NAME=\"living room\"\n"
              "SINGLE='x y'\n"
              "HUE_USER=first\n"
              "HUE_USER=second\n"
              "not a pair\n");

    EnvFile env(envPath());
    ASSERT_TRUE(env.load());
    EXPECT_EQ(env.value(QStringLiteral("HUE_BRIDGE_HOST")), QStringLiteral("192.168.1.2"));
    EXPECT_EQ(env.value(QStringLiteral("NAME")), QStringLiteral("living room"));
    EXPECT_EQ(env.value(QStringLiteral("SINGLE")), QStringLiteral("x y"));
    EXPECT_EQ(env.value(QStringLiteral("HUE_USER")), QStringLiteral("second"));
    EXPECT_EQ(env.keys(),
              (QStringList{QStringLiteral("HUE_BRIDGE_HOST"), QStringLiteral("NAME"), QStringLiteral("SINGLE"),
                           QStringLiteral("HUE_USER")}));
}

TEST_F(EnvFileTest, ValuesWithSpacesAreQuoted)
{
    EnvFile env(envPath());
    ASSERT_TRUE(env.load());
    env.setValue(QStringLiteral("LABEL"), QStringLiteral("hall # 2"));
    ASSERT_TRUE(env.save());

    EXPECT_EQ(readFile(envPath()), QByteArray("LABEL=\"hall # 2\"\n"));
    EnvFile reloaded(envPath());
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.value(QStringLiteral("LABEL")), QStringLiteral("hall # 2"));
}
