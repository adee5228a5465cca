#pragma once

#include <bullvision/server/i_tool_servers.hpp>

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace bullvision {
namespace testing {

/// Text-content tool result, the shape tools/call returns.
inline nlohmann::json TextResult(const std::string& text) {
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}

struct ToolCallRecord {
    std::string server;
    std::string tool;
    nlohmann::json arguments;
};

// ---------------------------------------------------------------------------
// MockToolServers — IToolServers keyed by handle name.
//
// SetTools()/FailListTools() fix the answer of ListTools for a server.
// CallTool results are queued per "server/tool" and consumed FIFO; an empty
// queue answers with a text block "ok".
// ---------------------------------------------------------------------------
class MockToolServers : public IToolServers {
public:
    void SetTools(const std::string& server, std::vector<ToolDescriptor> tools) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_.insert_or_assign(server, Result<std::vector<ToolDescriptor>, Error>::Ok(std::move(tools)));
    }

    void FailListTools(const std::string& server, Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_.insert_or_assign(server, Result<std::vector<ToolDescriptor>, Error>::Err(std::move(error)));
    }

    void EnqueueCall(const std::string& server, const std::string& tool,
                     Result<nlohmann::json, Error> result) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_queue_[server + "/" + tool].push_back(std::move(result));
    }

    Result<std::vector<ToolDescriptor>, Error> ListTools(const ServerHandle& handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++list_calls_;
        auto it = tools_.find(handle.Name());
        if (it == tools_.end()) {
            return Result<std::vector<ToolDescriptor>, Error>::Ok(std::vector<ToolDescriptor>{});
        }
        return it->second;
    }

    Result<nlohmann::json, Error> CallTool(const ServerHandle& handle,
                                           const std::string& tool_name,
                                           const nlohmann::json& arguments) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(ToolCallRecord{handle.Name(), tool_name, arguments});
        auto& queue = calls_queue_[handle.Name() + "/" + tool_name];
        if (queue.empty()) {
            return Result<nlohmann::json, Error>::Ok(TextResult("ok"));
        }
        auto result = std::move(queue.front());
        queue.pop_front();
        return result;
    }

    std::vector<ToolCallRecord> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    int ListCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return list_calls_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Result<std::vector<ToolDescriptor>, Error>> tools_;
    std::map<std::string, std::deque<Result<nlohmann::json, Error>>> calls_queue_;
    std::vector<ToolCallRecord> calls_;
    int list_calls_ = 0;
};

} // namespace testing
} // namespace bullvision
