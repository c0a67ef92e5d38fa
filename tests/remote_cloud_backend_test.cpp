#include "enclave/backends/remote_cloud_backend.hpp"
#include "enclave/core/errors.hpp"
#include "enclave/core/sandbox_factory.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace {

using ::enclave::backends::RemoteCloudBackend;
using ::enclave::core::BackendKind;
using ::enclave::core::CancellationToken;
using ::enclave::core::ErrorKind;
using ::enclave::core::ExecutionKind;
using ::enclave::core::ExecutionRequest;
using ::enclave::core::SandboxConfigBuilder;
using ::enclave::core::SandboxError;
using ::enclave::core::SandboxFactory;
using ::enclave::core::SandboxState;
using ::enclave::utils::HttpRequest;
using ::enclave::utils::HttpResponse;
using ::enclave::utils::HttpTransport;
using ::enclave::utils::TransportError;
using ::testing::HasSubstr;
using ::testing::Optional;
using ::testing::StartsWith;
using json = nlohmann::json;

constexpr const char* kServer = "https://sandbox.test/api";

std::string UrlDecode(const std::string& text) {
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += text[i];
        }
    }
    return out;
}

HttpResponse Respond(long status, const std::string& body = "") {
    HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

/**
 * In-memory sandbox service speaking the REST wire contract
 */
class FakeSandboxService : public HttpTransport {
public:
    HttpResponse Send(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (fail_with) {
            throw *fail_with;
        }

        std::string target = request.url.substr(std::string(kServer).size());
        std::string path = target.substr(0, target.find('?'));
        std::string query = target.find('?') == std::string::npos ? "" : target.substr(target.find('?') + 1);
        std::string query_path = query.rfind("path=", 0) == 0 ? UrlDecode(query.substr(5)) : "";

        if (request.method == "POST" && path == "/sandbox") {
            if (create_status != 200) {
                return Respond(create_status, "quota exceeded");
            }
            last_create = json::parse(request.body);
            std::string id = "sb-" + std::to_string(++next_id_);
            states[id] = initial_state;
            if (create_reply) {
                return Respond(200, create_reply(id).dump());
            }
            return Respond(200, json{{"id", id}, {"state", initial_state}}.dump());
        }
        if (request.method == "GET" && path == "/sandbox") {
            json listing = json::array();
            for (const auto& entry : states) {
                listing.push_back({{"id", entry.first}, {"state", entry.second}});
            }
            return Respond(200, listing.dump());
        }
        if (path.rfind("/sandbox/", 0) == 0) {
            std::string id = path.substr(9);
            if (!states.count(id)) {
                return Respond(404, "not found");
            }
            if (request.method == "DELETE") {
                states.erase(id);
                return Respond(200);
            }
            if (on_poll) {
                auto hooked = on_poll(id);
                if (hooked) {
                    return *hooked;
                }
            }
            return Respond(200, json{{"id", id}, {"state", states[id]}}.dump());
        }

        // /toolbox/{id}/toolbox/<operation>
        std::string id = path.substr(9, path.find('/', 9) - 9);
        if (!states.count(id)) {
            return Respond(404, "not found");
        }
        std::string operation = path.substr(path.find("/toolbox/", 9) + 9);

        if (operation == "process/execute") {
            auto body = json::parse(request.body);
            std::string command = body["command"];
            if (command.rfind("timeout ", 0) == 0) {
                executed.push_back(body);
                if (execute_fails_with) {
                    throw *execute_fails_with;
                }
                std::this_thread::sleep_for(execute_delay);
                return Respond(200, json{{"exitCode", exec_exit_code}, {"result", exec_output}}.dump());
            }
            return Respond(200, json{{"exitCode", 0}, {"result", ""}}.dump());
        }
        if (operation == "files/upload") {
            files[query_path] = request.upload ? request.upload->content : "";
            return Respond(200);
        }
        if (operation == "files/download") {
            if (!files.count(query_path)) {
                return Respond(404, "file not found");
            }
            return Respond(200, files[query_path]);
        }
        if (operation == "files") {
            return Respond(200, ListDirectory(query_path).dump());
        }
        return Respond(400, "unexpected " + request.method + " " + path);
    }

    size_t CountRequests(const std::string& method, const std::string& fragment) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.method == method && r.url.find(fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

    std::map<std::string, std::string> states;
    std::map<std::string, std::string> files;
    std::vector<HttpRequest> requests;
    std::vector<json> executed;
    json last_create;
    std::string initial_state{"started"};
    long create_status{200};
    int exec_exit_code{0};
    std::string exec_output;
    std::optional<TransportError> fail_with;
    std::optional<TransportError> execute_fails_with;
    std::chrono::milliseconds execute_delay{0};
    std::function<std::optional<HttpResponse>(const std::string& id)> on_poll;
    std::function<json(const std::string& id)> create_reply;

private:
    json ListDirectory(const std::string& directory) const {
        json entries = json::array();
        std::set<std::string> dirs;
        for (const auto& file : files) {
            if (file.first.rfind(directory + "/", 0) != 0) {
                continue;
            }
            std::string rest = file.first.substr(directory.size() + 1);
            auto slash = rest.find('/');
            if (slash == std::string::npos) {
                entries.push_back({{"name", rest}, {"isDir", false}, {"size", file.second.size()}});
            } else if (dirs.insert(rest.substr(0, slash)).second) {
                entries.push_back({{"name", rest.substr(0, slash)}, {"isDir", true}});
            }
        }
        return entries;
    }

    std::mutex mutex_;
    int next_id_{0};
};

class RemoteCloudBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<FakeSandboxService>();
        auto config = SandboxFactory::Validate(
            SandboxConfigBuilder()
                .WithBackend(BackendKind::REMOTE)
                .WithApiKey("dtn-key")
                .WithServerUrl(std::string(kServer) + "/")
                .Build(),
            [](const std::string&) { return std::optional<std::string>(); });
        config.remote.provision_timeout = std::chrono::seconds(5);
        backend_ = std::make_unique<RemoteCloudBackend>(config, service_);
    }

    ErrorKind ErrorOf(const std::function<void()>& operation) {
        try {
            operation();
        } catch (const SandboxError& e) {
            return e.Kind();
        }
        ADD_FAILURE() << "operation succeeded";
        return ErrorKind::TRANSPORT;
    }

    std::shared_ptr<FakeSandboxService> service_;
    std::unique_ptr<RemoteCloudBackend> backend_;
};

TEST(RemoteServiceStateTest, MapsServiceStates) {
    EXPECT_THAT(RemoteCloudBackend::MapServiceState("started"), Optional(SandboxState::RUNNING));
    EXPECT_THAT(RemoteCloudBackend::MapServiceState("STOPPED"), Optional(SandboxState::STOPPED));
    EXPECT_THAT(RemoteCloudBackend::MapServiceState("archived"), Optional(SandboxState::STOPPED));
    EXPECT_THAT(RemoteCloudBackend::MapServiceState("destroyed"), Optional(SandboxState::DESTROYED));
    EXPECT_THAT(RemoteCloudBackend::MapServiceState("build_failed"), Optional(SandboxState::FAILED));
    EXPECT_FALSE(RemoteCloudBackend::MapServiceState("creating").has_value());
    EXPECT_FALSE(RemoteCloudBackend::MapServiceState("starting").has_value());
}

TEST_F(RemoteCloudBackendTest, CreateSendsLimitsAndInitializesWorkspace) {
    auto sandbox = backend_->Create(CancellationToken::None());

    EXPECT_EQ(sandbox.State(), SandboxState::RUNNING);
    EXPECT_EQ(sandbox.Id(), "sb-1");

    const auto& body = service_->last_create;
    EXPECT_EQ(body["memory"], 4);
    EXPECT_EQ(body["disk"], 10);
    EXPECT_EQ(body["autoStopInterval"], 30);
    EXPECT_EQ(body["labels"]["enclave.run"], backend_->RunLabel());
    EXPECT_EQ(body["labels"]["enclave.sandbox"], sandbox.Name());

    ASSERT_FALSE(service_->requests.empty());
    EXPECT_EQ(service_->requests[0].url, std::string(kServer) + "/sandbox");
    EXPECT_EQ(service_->requests[0].headers.at("Authorization"), "Bearer dtn-key");
    EXPECT_EQ(service_->CountRequests("POST", "/toolbox/sb-1/toolbox/process/execute"), 1u);
}

TEST_F(RemoteCloudBackendTest, PollsUntilStarted) {
    service_->initial_state = "creating";
    int polls = 0;
    service_->on_poll = [this, &polls](const std::string& id) -> std::optional<HttpResponse> {
        if (++polls == 1) {
            service_->states[id] = "started";
        }
        return std::nullopt;
    };

    auto sandbox = backend_->Create(CancellationToken::None());

    EXPECT_EQ(sandbox.State(), SandboxState::RUNNING);
    EXPECT_EQ(polls, 1);
}

TEST_F(RemoteCloudBackendTest, CreationFailureRetriesOnceThenFails) {
    service_->create_status = 500;

    EXPECT_EQ(ErrorOf([this] { backend_->Create(CancellationToken::None()); }),
              ErrorKind::SANDBOX_CREATION_FAILED);
    EXPECT_EQ(service_->CountRequests("POST", "/sandbox"), 2u);
}

TEST_F(RemoteCloudBackendTest, MalformedCreateReplyIsRetriedThenFails) {
    service_->create_reply = [](const std::string&) { return json{{"id", 123}, {"state", "started"}}; };

    try {
        backend_->Create(CancellationToken::None());
        FAIL() << "expected SANDBOX_CREATION_FAILED";
    } catch (const SandboxError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::SANDBOX_CREATION_FAILED);
        EXPECT_THAT(e.what(), HasSubstr("Malformed response"));
    }
    EXPECT_EQ(service_->CountRequests("POST", "/sandbox"), 2u);
}

TEST_F(RemoteCloudBackendTest, MalformedStateDeletesPartialSandbox) {
    service_->create_reply = [](const std::string& id) { return json{{"id", id}, {"state", 7}}; };

    EXPECT_EQ(ErrorOf([this] { backend_->Create(CancellationToken::None()); }),
              ErrorKind::SANDBOX_CREATION_FAILED);
    EXPECT_EQ(service_->CountRequests("DELETE", "/sandbox/sb-1"), 1u);
    EXPECT_EQ(service_->CountRequests("DELETE", "/sandbox/sb-2"), 1u);
    EXPECT_TRUE(service_->states.empty());
}

TEST_F(RemoteCloudBackendTest, CancelDuringProvisioningDeletesLabelledSandboxes) {
    service_->initial_state = "creating";
    CancellationToken token;
    service_->on_poll = [&token](const std::string&) -> std::optional<HttpResponse> {
        token.Cancel("iteration limit reached");
        HttpResponse aborted;
        aborted.aborted = true;
        return aborted;
    };

    EXPECT_EQ(ErrorOf([&] { backend_->Create(token); }), ErrorKind::CANCELLED);
    EXPECT_TRUE(service_->states.empty());
    EXPECT_EQ(service_->CountRequests("GET", "/sandbox?labels="), 1u);
    EXPECT_EQ(service_->CountRequests("DELETE", "/sandbox/sb-1"), 1u);
}

TEST_F(RemoteCloudBackendTest, ExecuteWrapsCommandInTimeout) {
    auto sandbox = backend_->Create(CancellationToken::None());
    service_->exec_output = "4\n";

    ExecutionRequest request;
    request.command = "echo $((2+2))";
    request.timeout = std::chrono::seconds(7);
    auto result = backend_->Execute(sandbox, request, CancellationToken::None());

    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "4\n");
    EXPECT_FALSE(result.truncated);

    ASSERT_EQ(service_->executed.size(), 1u);
    const auto& payload = service_->executed[0];
    EXPECT_THAT(payload["command"].get<std::string>(), StartsWith("timeout -k 2 7 /bin/bash -c "));
    EXPECT_EQ(payload["cwd"], "/workspace");
    EXPECT_EQ(payload["timeout"], 12);
}

TEST_F(RemoteCloudBackendTest, PythonUploadsScriptFirst) {
    auto sandbox = backend_->Create(CancellationToken::None());

    ExecutionRequest request;
    request.kind = ExecutionKind::PYTHON;
    request.command = "print(2+2)";
    backend_->Execute(sandbox, request, CancellationToken::None());

    EXPECT_EQ(service_->files.at("/workspace/temp/_script.py"), "print(2+2)");
    ASSERT_EQ(service_->executed.size(), 1u);
    EXPECT_THAT(service_->executed[0]["command"].get<std::string>(), HasSubstr("python3"));
}

TEST_F(RemoteCloudBackendTest, TransferTimeoutBecomesTimeoutResult) {
    auto sandbox = backend_->Create(CancellationToken::None());
    service_->execute_fails_with = TransportError("operation timed out", true);

    ExecutionRequest request;
    request.command = "sleep 100";
    request.timeout = std::chrono::seconds(2);
    auto result = backend_->Execute(sandbox, request, CancellationToken::None());

    EXPECT_TRUE(result.TimedOut());
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.exit_code, enclave::core::kTimeoutExitCode);
    EXPECT_THAT(result.stderr_output, StartsWith("Command timed out after 2 seconds"));

    service_->execute_fails_with = TransportError("connection reset");
    EXPECT_EQ(ErrorOf([&] { backend_->Execute(sandbox, request, CancellationToken::None()); }),
              ErrorKind::TRANSPORT);
}

TEST_F(RemoteCloudBackendTest, WrapperExitAtDeadlineIsTimeout) {
    auto sandbox = backend_->Create(CancellationToken::None());
    service_->exec_exit_code = 124;
    service_->exec_output = "partial";

    ExecutionRequest request;
    request.command = "false";
    request.timeout = std::chrono::seconds(1);

    // A fast 124 is the command's own exit code.
    auto fast = backend_->Execute(sandbox, request, CancellationToken::None());
    EXPECT_EQ(fast.exit_code, 124);
    EXPECT_FALSE(fast.TimedOut());

    service_->execute_delay = std::chrono::milliseconds(1000);
    auto slow = backend_->Execute(sandbox, request, CancellationToken::None());
    EXPECT_TRUE(slow.TimedOut());
    EXPECT_EQ(slow.exit_code, enclave::core::kTimeoutExitCode);
    EXPECT_EQ(slow.stdout_output, "partial");
}

TEST_F(RemoteCloudBackendTest, WriteReadAndDownloadArtifacts) {
    auto sandbox = backend_->Create(CancellationToken::None());
    const std::string payload = R"({"key":"value"})";

    backend_->WriteFile(sandbox, "output/test.json", payload, CancellationToken::None());
    backend_->WriteFile(sandbox, "output/plots/chart.csv", "a,b\n", CancellationToken::None());
    backend_->WriteFile(sandbox, "output/notes.txt", "skip me", CancellationToken::None());

    EXPECT_EQ(backend_->ReadFile(sandbox, "output/test.json", CancellationToken::None()), payload);

    auto bundle = backend_->DownloadArtifacts(sandbox, {".json", ".csv"}, CancellationToken::None());
    ASSERT_EQ(bundle.files.size(), 2u);
    EXPECT_EQ(bundle.files.at("output/test.json"), payload);
    EXPECT_EQ(bundle.files.at("output/plots/chart.csv"), "a,b\n");

    EXPECT_TRUE(backend_->DownloadArtifacts(sandbox, {".json"}, CancellationToken::None()).files.empty());

    backend_->WriteFile(sandbox, "output/test.json", "{}", CancellationToken::None());
    auto changed = backend_->DownloadArtifacts(sandbox, {".json"}, CancellationToken::None());
    EXPECT_EQ(changed.files.at("output/test.json"), "{}");
}

TEST_F(RemoteCloudBackendTest, FileErrors) {
    auto sandbox = backend_->Create(CancellationToken::None());
    auto before = service_->requests.size();

    EXPECT_EQ(ErrorOf([&] { backend_->ReadFile(sandbox, "../etc/passwd", CancellationToken::None()); }),
              ErrorKind::PATH_ESCAPE);
    EXPECT_EQ(service_->requests.size(), before);

    EXPECT_EQ(ErrorOf([&] { backend_->ReadFile(sandbox, "output/none.txt", CancellationToken::None()); }),
              ErrorKind::FILE_NOT_FOUND);

    service_->fail_with = TransportError("connection reset");
    EXPECT_EQ(ErrorOf([&] { backend_->ReadFile(sandbox, "output/none.txt", CancellationToken::None()); }),
              ErrorKind::TRANSPORT);
}

TEST_F(RemoteCloudBackendTest, AutoStopIsObservedOnNextUse) {
    auto sandbox = backend_->Create(CancellationToken::None());
    service_->states[sandbox.Id()] = "stopped";

    ExecutionRequest request;
    request.command = "ls";
    EXPECT_EQ(ErrorOf([&] { backend_->Execute(sandbox, request, CancellationToken::None()); }),
              ErrorKind::SANDBOX_NOT_READY);
    EXPECT_EQ(sandbox.State(), SandboxState::STOPPED);
    EXPECT_TRUE(service_->executed.empty());

    EXPECT_NO_THROW(backend_->Destroy(sandbox, CancellationToken::None()));
    EXPECT_TRUE(service_->states.empty());
}

TEST_F(RemoteCloudBackendTest, DestroyIsIdempotent) {
    auto sandbox = backend_->Create(CancellationToken::None());

    backend_->Destroy(sandbox, CancellationToken::None());
    EXPECT_EQ(sandbox.State(), SandboxState::DESTROYED);
    auto deletes = service_->CountRequests("DELETE", "/sandbox/");

    backend_->Destroy(sandbox, CancellationToken::None());
    EXPECT_EQ(service_->CountRequests("DELETE", "/sandbox/"), deletes);
}

TEST_F(RemoteCloudBackendTest, SandboxDeletedByServiceIsDestroyed) {
    auto sandbox = backend_->Create(CancellationToken::None());
    service_->states.clear();

    EXPECT_EQ(backend_->RefreshState(sandbox, CancellationToken::None()), SandboxState::DESTROYED);
    EXPECT_NO_THROW(backend_->Destroy(sandbox, CancellationToken::None()));
}

} // namespace
