/// @file coordinated_activity/main.cpp
/// @brief Example: coordinate a long-running activity against an in-memory
/// service.
///
/// This example demonstrates:
///   1. Writing a coordinated handler with FuncCoordinatedActivityHandler.
///   2. Configuring a CoordinatedActivityWorker with heartbeat and tick
///      timing and an interceptor.
///   3. Handling one claimed task and inspecting what was sent to the
///      service: start and progress signals, heartbeats and the final
///      completion.

#include <swfcoord/activities/coordinated_handler.h>
#include <swfcoord/converters/data_converter.h>
#include <swfcoord/testing/fake_activity_service.h>
#include <swfcoord/version.h>
#include <swfcoord/worker/coordinated_activity_worker.h>
#include <swfcoord/worker/interceptors/activity_interceptor.h>

#include <any>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace activities = swfcoord::activities;
namespace worker = swfcoord::worker;

// Grows a cluster one node per tick until it reaches the requested size.
class ClusterResize {
public:
    std::any start(const activities::ActivityTask& task,
                   const std::any& input) {
        target_ = swfcoord::converters::DataConverter().decode<nlohmann::json>(
            input)["target"].get<int>();
        std::cout << "Resizing cluster for " << task.activity_id << " to "
                  << target_ << " nodes\n";
        return nlohmann::json{{"nodes", nodes_}, {"target", target_}};
    }

    activities::TickResult tick(const activities::ActivityTask&,
                                const std::any&) {
        ++nodes_;
        if (nodes_ < target_) {
            return {true, nlohmann::json{{"nodes", nodes_}}};
        }
        return {false, nlohmann::json{{"nodes", nodes_}, {"ready", true}}};
    }

    void cancel(const activities::ActivityTask&, const std::any&) {
        std::cout << "Resize canceled at " << nodes_ << " nodes\n";
    }

private:
    int nodes_ = 0;
    int target_ = 0;
};

int main() {
    std::cout << "swfcoord v" << swfcoord::version() << "\n";
    std::cout << "Coordinated activity example\n\n";

    using namespace std::chrono_literals;

    try {
        auto service =
            std::make_shared<swfcoord::testing::FakeActivityService>();
        auto resize = std::make_shared<ClusterResize>();

        // Step 1: Wrap the business logic in a handler.
        auto handler =
            std::make_shared<activities::FuncCoordinatedActivityHandler>(
                "TestActivity",
                [resize](const activities::ActivityTask& task,
                         const std::any& input) {
                    return resize->tick(task, input);
                },
                [resize](const activities::ActivityTask& task,
                         const std::any& input) {
                    return resize->start(task, input);
                },
                [resize](const activities::ActivityTask& task,
                         const std::any& input) {
                    resize->cancel(task, input);
                });

        // Step 2: Configure the worker.
        auto logger =
            std::make_shared<worker::interceptors::FuncInterceptor>();
        logger->before_task_fn = [](const activities::ActivityTask& task) {
            std::cout << "Task " << task.activity_id << " started\n";
        };

        worker::CoordinatedActivityWorkerOptions opts;
        opts.domain = "example-domain";
        opts.coordination.heartbeat_interval = 50ms;
        opts.coordination.tick_min_interval = 20ms;
        opts.interceptors.push_back(logger);

        worker::CoordinatedActivityWorker w(service, handler, opts);

        // Step 3: Handle one task.
        auto outcome =
            w.handle_activity_task(swfcoord::testing::default_activity_task());

        std::cout << "\nSignals sent:\n";
        for (const auto& signal : service->signals()) {
            std::cout << "  " << signal.signal_name() << " " << signal.input()
                      << "\n";
        }
        std::cout << "Heartbeats sent: " << service->heartbeat_count() << "\n";
        if (outcome.is_completed() && !service->completed().empty()) {
            std::cout << "Completed with " << service->completed()[0].result()
                      << "\n";
        } else {
            std::cerr << "Activity did not complete\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
