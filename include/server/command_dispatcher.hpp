#pragma once

#include "core/error.hpp"
#include "core/json.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dbgate {

class Gateway;

/**
 * @brief Maps command names to Gateway operations
 *
 * Arguments arrive as a JSON object with named fields; replies use the
 * envelope {"ok":true,"data":...} or
 * {"ok":false,"error":"<message>","category":"<NotConnected|...>"}.
 */
class CommandDispatcher {
public:
    using Handler = std::function<Result<Json>(const Json& args)>;

    explicit CommandDispatcher(std::shared_ptr<Gateway> gateway);

    /**
     * @brief Run a command; unknown names are INVALID_REQUEST
     */
    [[nodiscard]] Result<Json> dispatch(const std::string& command, const Json& args) const;

    [[nodiscard]] bool has_command(const std::string& command) const {
        return handlers_.contains(command);
    }

    [[nodiscard]] std::vector<std::string> command_names() const;

    [[nodiscard]] static Json envelope(const Result<Json>& result);

private:
    void register_redis();
    void register_mongodb();
    void register_sql();

    std::shared_ptr<Gateway> gateway_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace dbgate
