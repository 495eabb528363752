#pragma once

#include <functional>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace remex::notify {

// Push channel addressed by a request guid. Delivery is best effort:
// implementations log failures and never throw from Send or Close.
class ResultNotifier {
public:
    virtual ~ResultNotifier() = default;

    virtual void Send(const std::string& guid, const nlohmann::json& result) = 0;
    virtual void Close() = 0;
};

using NotifierFactory = std::function<std::unique_ptr<ResultNotifier>()>;

}  // namespace remex::notify
