#include "db/mongodb/mongo_adapter.hpp"
#include "core/utils.hpp"

namespace dbgate {

MongoAdapter::MongoAdapter(std::shared_ptr<IDocumentClient> client)
    : client_(std::move(client)) {}

Result<std::vector<std::string>> MongoAdapter::list_databases() {
    using R = Result<std::vector<std::string>>;

    auto reply = client_->run_command("admin", Json{{"listDatabases", 1}, {"nameOnly", true}});
    if (reply.is_error()) {
        return R::error_from(reply);
    }

    std::vector<std::string> names;
    const auto it = reply.value().find("databases");
    if (it == reply.value().end() || !it->is_array()) {
        return R::error(ErrorCategory::QUERY_ERROR, "listDatabases reply has no 'databases' array");
    }
    for (const auto& db : *it) {
        if (db.is_object() && db.contains("name") && db["name"].is_string()) {
            names.push_back(utils::lossy_utf8(db["name"].get<std::string>()));
        }
    }
    return R::ok(std::move(names));
}

} // namespace dbgate
