#pragma once

#include "core/error.hpp"
#include "db/mongodb/mongo_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dbgate {

// Database listing over a borrowed document client
class MongoAdapter {
public:
    explicit MongoAdapter(std::shared_ptr<IDocumentClient> client);

    // listDatabases with nameOnly
    [[nodiscard]] Result<std::vector<std::string>> list_databases();

private:
    std::shared_ptr<IDocumentClient> client_;
};

} // namespace dbgate
