#include "gtest/gtest.h"

#include <QDir>
#include <QFile>
#include <QMap>
#include <QTemporaryDir>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/mongodb/MongoConnector.h"
#include "mongogui/core/settings/ConnectionStore.h"
#include "mongogui/core/settings/SecretStore.h"

using namespace MongoGui;

namespace
{
    class InMemorySecretStore : public SecretStore
    {
    public:
        InMemorySecretStore() : broken(false) {}

        void writePassword(const QString &key, const QString &password) override
        {
            if (broken)
                throw PersistenceError("keyring locked");
            secrets[key] = password;
        }

        QString readPassword(const QString &key) override
        {
            if (broken)
                throw PersistenceError("keyring locked");
            return secrets.value(key);
        }

        void deletePassword(const QString &key) override
        {
            if (broken)
                throw PersistenceError("keyring locked");
            secrets.remove(key);
        }

        QMap<QString, QString> secrets;
        bool broken;
    };

    class PingSession : public MongoSession
    {
    public:
        void ping() override {}
        std::vector<std::string> collectionNames(const std::string &) override { return {}; }
        std::vector<mongo::BSONObj> find(const std::string &, const std::string &, const mongo::BSONObj &,
                                         const mongo::BSONObj &, const mongo::BSONObj &, int, int) override { return {}; }
        std::vector<mongo::BSONObj> aggregate(const std::string &, const std::string &,
                                              const std::vector<mongo::BSONObj> &, int) override { return {}; }
        mongo::BSONObj runCommand(const std::string &, const mongo::BSONObj &) override { return mongo::BSONObj(); }
    };

    class RecordingConnector : public MongoConnector
    {
    public:
        RecordingConnector() : refuse(false), connects(0), lastTimeoutSec(0) {}

        std::unique_ptr<MongoSession> connect(const ConnectionSettings &profile, int timeoutSec) override
        {
            ++connects;
            lastTimeoutSec = timeoutSec;
            lastPassword = profile.credential().userPassword();
            if (refuse)
                throw ConnectionError("Connection refused");
            return std::unique_ptr<MongoSession>(new PingSession());
        }

        bool refuse;
        int connects;
        int lastTimeoutSec;
        std::string lastPassword;
    };

    ConnectionSettings makeProfile(const std::string &name, const std::string &user = "alice")
    {
        ConnectionSettings profile;
        profile.setConnectionName(name);
        profile.setServerHost("db.example.com");
        profile.setServerPort(27018);
        profile.setDefaultDatabase("inventory");
        profile.credential().setUserName(user);
        return profile;
    }

    QStringList names(const ConnectionStore::ConnectionSettingsContainerType &profiles)
    {
        QStringList list;
        for (auto const &profile : profiles)
            list << QString::fromStdString(profile.connectionName());
        return list;
    }

    class ConnectionStoreTest : public ::testing::Test
    {
    protected:
        ConnectionStoreTest() :
            filePath(dir.filePath("connections.json")),
            store(filePath, secrets, connector) {}

        QByteArray fileContents() const
        {
            QFile f(filePath);
            if (!f.open(QIODevice::ReadOnly))
                return QByteArray();
            return f.readAll();
        }

        QTemporaryDir dir;
        QString filePath;
        InMemorySecretStore secrets;
        RecordingConnector connector;
        ConnectionStore store;
    };
}

TEST_F(ConnectionStoreTest, save_ThenResolve_ReturnsSameFieldsAndPassword)
{
    ConnectionSettings profile = makeProfile("prod");
    profile.setTlsEnabled(true);
    store.save(profile, "s3cret");

    ConnectionSettings resolved = store.resolve("prod");
    EXPECT_TRUE(resolved.sameProfile(profile));
    EXPECT_EQ("s3cret", resolved.credential().userPassword());
    EXPECT_EQ("s3cret", secrets.secrets.value("prod"));
}

TEST_F(ConnectionStoreTest, save_WithoutPassword_ResolvesEmptyPassword)
{
    store.save(makeProfile("dev", ""), "");
    EXPECT_EQ("", store.resolve("dev").credential().userPassword());
    EXPECT_TRUE(secrets.secrets.isEmpty());
}

TEST_F(ConnectionStoreTest, list_PreservesInsertionOrderWithoutPasswords)
{
    store.save(makeProfile("b"), "1");
    store.save(makeProfile("a"), "2");
    store.save(makeProfile("c"), "3");

    ConnectionStore::ConnectionSettingsContainerType profiles = store.list();
    EXPECT_EQ(QStringList() << "b" << "a" << "c", names(profiles));
    for (auto const &profile : profiles)
        EXPECT_TRUE(profile.credential().userPassword().empty());
}

TEST_F(ConnectionStoreTest, save_ExistingName_ReplacesInPlace)
{
    store.save(makeProfile("first"), "");
    store.save(makeProfile("second"), "");

    ConnectionSettings changed = makeProfile("first");
    changed.setServerPort(27100);
    store.save(changed, "");

    ConnectionStore::ConnectionSettingsContainerType profiles = store.list();
    EXPECT_EQ(QStringList() << "first" << "second", names(profiles));
    EXPECT_EQ(27100, profiles[0].serverPort());
}

TEST_F(ConnectionStoreTest, save_EmptyPassword_KeepsStoredPassword)
{
    store.save(makeProfile("prod"), "s3cret");
    store.save(makeProfile("prod"), "");
    EXPECT_EQ("s3cret", store.resolve("prod").credential().userPassword());
}

TEST_F(ConnectionStoreTest, profileFile_NeverContainsPassword)
{
    store.save(makeProfile("prod"), "TopSecretPassword");

    const QByteArray contents = fileContents();
    ASSERT_FALSE(contents.isEmpty());
    EXPECT_FALSE(contents.contains("TopSecretPassword"));
    EXPECT_TRUE(contents.contains("db.example.com"));
}

TEST_F(ConnectionStoreTest, remove_DeletesProfileAndSecret)
{
    store.save(makeProfile("prod"), "s3cret");
    store.save(makeProfile("dev"), "");
    store.remove("prod");

    EXPECT_EQ(QStringList() << "dev", names(store.list()));
    EXPECT_FALSE(secrets.secrets.contains("prod"));
    EXPECT_THROW(store.remove("prod"), NotFoundError);
}

TEST_F(ConnectionStoreTest, resolve_UnknownName_ThrowsNotFound)
{
    EXPECT_THROW(store.resolve("nope"), NotFoundError);
}

TEST_F(ConnectionStoreTest, save_InvalidFields_ThrowsValidationAndWritesNothing)
{
    ConnectionSettings badPort = makeProfile("bad");
    badPort.setServerPort(70000);
    EXPECT_THROW(store.save(badPort, ""), ValidationError);

    ConnectionSettings badHost = makeProfile("bad");
    badHost.setServerHost("db example");
    EXPECT_THROW(store.save(badHost, ""), ValidationError);

    ConnectionSettings noName = makeProfile("");
    EXPECT_THROW(store.save(noName, ""), ValidationError);

    EXPECT_FALSE(QFile::exists(filePath));
}

TEST_F(ConnectionStoreTest, update_Rename_MigratesSecretAndKeepsPosition)
{
    store.save(makeProfile("old"), "s3cret");
    store.save(makeProfile("other"), "");

    store.update("old", makeProfile("new"), "");

    EXPECT_EQ(QStringList() << "new" << "other", names(store.list()));
    EXPECT_EQ("s3cret", store.resolve("new").credential().userPassword());
    EXPECT_FALSE(secrets.secrets.contains("old"));
    EXPECT_THROW(store.resolve("old"), NotFoundError);
}

TEST_F(ConnectionStoreTest, update_RenameWithPassword_StoresNewPassword)
{
    store.save(makeProfile("old"), "s3cret");
    store.update("old", makeProfile("new"), "changed");

    EXPECT_EQ("changed", secrets.secrets.value("new"));
    EXPECT_FALSE(secrets.secrets.contains("old"));
}

TEST_F(ConnectionStoreTest, update_RenameFileWriteFails_KeepsOldSecret)
{
    store.save(makeProfile("old"), "s3cret");

    // A directory in place of the file makes the next write fail
    ASSERT_TRUE(QFile::remove(filePath));
    ASSERT_TRUE(QDir().mkpath(filePath));

    EXPECT_THROW(store.update("old", makeProfile("new"), ""), PersistenceError);

    EXPECT_EQ(QStringList() << "old", names(store.list()));
    EXPECT_EQ("s3cret", store.resolve("old").credential().userPassword());
    EXPECT_FALSE(secrets.secrets.contains("new"));
}

TEST_F(ConnectionStoreTest, update_RenameWithNewPasswordFileWriteFails_LeavesNoStraySecret)
{
    store.save(makeProfile("old"), "s3cret");
    ASSERT_TRUE(QFile::remove(filePath));
    ASSERT_TRUE(QDir().mkpath(filePath));

    EXPECT_THROW(store.update("old", makeProfile("new"), "changed"), PersistenceError);

    EXPECT_EQ("s3cret", secrets.secrets.value("old"));
    EXPECT_FALSE(secrets.secrets.contains("new"));
}

TEST_F(ConnectionStoreTest, update_RenameSecretStoreFailure_KeepsOldName)
{
    store.save(makeProfile("old"), "s3cret");
    secrets.broken = true;

    EXPECT_THROW(store.update("old", makeProfile("new"), ""), PersistenceError);

    secrets.broken = false;
    EXPECT_EQ(QStringList() << "old", names(store.list()));
    EXPECT_EQ("s3cret", store.resolve("old").credential().userPassword());

    ConnectionStore reopened(filePath, secrets, connector);
    EXPECT_EQ(QStringList() << "old", names(reopened.list()));
}

TEST_F(ConnectionStoreTest, save_NameWithSurroundingSpaces_IsStoredTrimmed)
{
    store.save(makeProfile(" prod "), "s3cret");
    store.save(makeProfile("prod"), "");

    EXPECT_EQ(QStringList() << "prod", names(store.list()));
    EXPECT_EQ("s3cret", secrets.secrets.value("prod"));
    EXPECT_EQ("s3cret", store.resolve("prod").credential().userPassword());
}

TEST_F(ConnectionStoreTest, update_NameWithSurroundingSpaces_IsNotARename)
{
    store.save(makeProfile("prod"), "s3cret");
    store.update(" prod", makeProfile("prod  "), "");

    EXPECT_EQ(QStringList() << "prod", names(store.list()));
    EXPECT_EQ("s3cret", secrets.secrets.value("prod"));
    EXPECT_EQ(1, secrets.secrets.size());
}

TEST_F(ConnectionStoreTest, update_RenameToExistingName_ThrowsValidation)
{
    store.save(makeProfile("a"), "");
    store.save(makeProfile("b"), "");
    EXPECT_THROW(store.update("a", makeProfile("b"), ""), ValidationError);
}

TEST_F(ConnectionStoreTest, update_UnknownName_ThrowsNotFound)
{
    EXPECT_THROW(store.update("ghost", makeProfile("ghost"), ""), NotFoundError);
}

TEST_F(ConnectionStoreTest, list_NewInstance_ReadsSavedFile)
{
    store.save(makeProfile("prod"), "s3cret");
    store.save(makeProfile("dev"), "");

    ConnectionStore reopened(filePath, secrets, connector);
    ConnectionStore::ConnectionSettingsContainerType profiles = reopened.list();
    ASSERT_EQ(2u, profiles.size());
    EXPECT_TRUE(profiles[0].sameProfile(makeProfile("prod")));
    EXPECT_EQ("s3cret", reopened.resolve("prod").credential().userPassword());
}

TEST_F(ConnectionStoreTest, list_CorruptFile_ThrowsPersistenceError)
{
    QFile f(filePath);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("{ not json");
    f.close();

    EXPECT_THROW(store.list(), PersistenceError);
}

TEST_F(ConnectionStoreTest, save_SecretStoreFailure_ThrowsPersistenceError)
{
    secrets.broken = true;
    EXPECT_THROW(store.save(makeProfile("prod"), "s3cret"), PersistenceError);
}

TEST_F(ConnectionStoreTest, test_Reachable_ReturnsOkAndPersistsNothing)
{
    ConnectionTestResult result = store.test(makeProfile("candidate"), "pw");

    EXPECT_TRUE(result._ok);
    EXPECT_EQ("pw", connector.lastPassword);
    EXPECT_FALSE(QFile::exists(filePath));
    EXPECT_TRUE(secrets.secrets.isEmpty());
}

TEST_F(ConnectionStoreTest, test_Refused_ReturnsReason)
{
    connector.refuse = true;
    ConnectionTestResult result = store.test(makeProfile("candidate"), "");

    EXPECT_FALSE(result._ok);
    EXPECT_EQ("Connection refused", result._reason);
}

TEST_F(ConnectionStoreTest, verifySecretStore_ReportsBackendState)
{
    EXPECT_TRUE(store.verifySecretStore());
    EXPECT_TRUE(secrets.secrets.isEmpty());

    secrets.broken = true;
    EXPECT_FALSE(store.verifySecretStore());
}

TEST_F(ConnectionStoreTest, setTimeoutSec_UsedByTest)
{
    store.setTimeoutSec(3);
    EXPECT_TRUE(store.test(makeProfile("prod"), "")._ok);
    EXPECT_EQ(3, connector.lastTimeoutSec);
}
