#pragma once
#include <utility> // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <functional>
#include <string>
#include <thread>

namespace Dockwire {
    // A single-threaded io_context running on its own thread. Closures posted to it run
    // one at a time in posting order.
    class InvocationWorker {
        boost::asio::io_context ioContext;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
        std::thread ioThread;
        std::string label;

        void run();

    public:
        explicit InvocationWorker(std::string label);
        ~InvocationWorker();

        InvocationWorker(const InvocationWorker&) = delete;
        InvocationWorker& operator=(const InvocationWorker&) = delete;

        void post(std::function<void()> task);

        // Runs everything posted so far, then stops and joins the thread. Handlers of
        // async operations still pending are not run.
        void stop();

        bool running() const;
        bool onWorkerThread() const;
        boost::asio::io_context& context() { return ioContext; }
    };
}
