#include "mongogui/core/mongodb/MongoClientConnector.h"

#include <QMutex>
#include <QMutexLocker>

#include <mongo/base/status.h>
#include <mongo/bson/bsonobjbuilder.h>
#include <mongo/client/dbclientinterface.h>
#include <mongo/util/assert_util.h>
#include <mongo/util/net/ssl_options.h>

#include "mongogui/core/Exceptions.h"
#include "mongogui/core/mongodb/MongoClient.h"
#include "mongogui/core/settings/ConnectionSettings.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/core/utils/QtUtils.h"

namespace
{
    std::string const AppNameVersion { PROJECT_NAME_LOWERCASE "-" PROJECT_VERSION };

    // SSL mode of the driver is global, connects with different
    // modes must not interleave
    QMutex connectLock;

    void configureSSL(const MongoGui::ConnectionSettings &profile)
    {
        if (profile.tlsEnabled()) {
            // Force SSL mode for outgoing connections
            mongo::sslGlobalParams.sslMode.store(mongo::SSLParams::SSLMode_requireSSL);
        }
        else {
            // Disable forced SSL mode for outgoing connections
            mongo::sslGlobalParams.sslMode.store(mongo::SSLParams::SSLMode_allowSSL);
        }
    }
}

namespace MongoGui
{
    std::unique_ptr<MongoSession> MongoClientConnector::connect(const ConnectionSettings &profile, int timeoutSec)
    {
        QMutexLocker lock(&connectLock);
        configureSSL(profile);

        const QString address = QtUtils::toQString(profile.getFullAddress());

        // Timeout for operations
        // Connect timeout is fixed, but short, at 5 seconds (see headers for DBClientConnection)
        std::unique_ptr<mongo::DBClientConnection> conn(new mongo::DBClientConnection { true, static_cast<double>(timeoutSec) });
        mongo::Status const &status = conn->connect(profile.hostAndPort(), AppNameVersion);
        if (!status.isOK()) {
            LOG_MSG("Cannot connect to " + address + ": " + QtUtils::toQString(status.reason()),
                    mongo::logger::LogSeverity::Warning());
            throw ConnectionError(QString("Cannot connect to %1: %2").arg(address, QtUtils::toQString(status.reason())));
        }

        const CredentialSettings &credential = profile.credential();
        if (credential.enabled()) {
            mongo::BSONObj authParams {
                mongo::BSONObjBuilder()
                .append("user", credential.userName())
                .append("db", profile.authDatabase())
                .append("pwd", credential.userPassword())
                .append("mechanism", credential.mechanism())
                .obj()
            };

            try {
                conn->auth(authParams);
            }
            catch (const mongo::DBException &ex) {
                throw ConnectionError(QString("Authentication failed for %1: %2")
                                      .arg(QtUtils::toQString(credential.userName()),
                                           QtUtils::toQString(ex.reason())));
            }
        }

        LOG_MSG("Connected to " + address, mongo::logger::LogSeverity::Info(), false);
        return std::unique_ptr<MongoSession>(new MongoClient(conn.release()));
    }
}
