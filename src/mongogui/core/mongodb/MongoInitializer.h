#pragma once

namespace MongoGui
{
    /**
     * @brief Prepares the mongo client library for outgoing connections:
     *        global initializers, IPv6 and TLS support, service context
     *        and its egress transport layer. Call once from main()
     *        before any connection is opened.
     */
    void initializeMongoClient(int argc, char *argv[], char **envp);
}
