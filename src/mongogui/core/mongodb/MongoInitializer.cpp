#include "mongogui/core/mongodb/MongoInitializer.h"

#include <memory>

// Header "mongo/platform/basic" is required by "socket_utils.h" under Windows
#include <mongo/platform/basic.h>
#include <mongo/util/net/socket_utils.h>
#include <mongo/base/initializer.h>
#include <mongo/util/assert_util.h>
#include <mongo/util/net/ssl_options.h>
#include <mongo/db/service_context.h>
#include <mongo/transport/transport_layer_asio.h>

namespace MongoGui
{
    void initializeMongoClient(int argc, char *argv[], char **envp)
    {
        // Support for IPv6 is disabled by default. Enable it.
        mongo::enableIPv6(true);

        // TLS is decided per profile, the client only has to allow it
        mongo::sslGlobalParams.sslMode.store(mongo::SSLParams::SSLMode_allowSSL);

        mongo::runGlobalInitializersOrDie(argc, argv, envp);

        mongo::setGlobalServiceContext(mongo::ServiceContext::make());
        mongo::ServiceContext *serviceContext = mongo::getGlobalServiceContext();

        mongo::transport::TransportLayerASIO::Options opts;
        opts.enableIPv6 = true;
        opts.mode = mongo::transport::TransportLayerASIO::Options::kEgress;
        serviceContext->setTransportLayer(
            std::make_unique<mongo::transport::TransportLayerASIO>(opts, nullptr));

        mongo::transport::TransportLayer *transport = serviceContext->getTransportLayer();
        uassertStatusOK(transport->setup());
        uassertStatusOK(transport->start());
    }
}
