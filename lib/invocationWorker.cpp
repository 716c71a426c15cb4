#include "invocationWorker.hpp"

#include "errors.hpp"
#include "log.hpp"

namespace Dockwire {
    InvocationWorker::InvocationWorker(std::string label) :
        work(boost::asio::make_work_guard(ioContext)),
        label(std::move(label))
    {
        ioThread = std::thread([this]() { run(); });
    }

    InvocationWorker::~InvocationWorker() {
        if (ioThread.joinable() && !onWorkerThread()) stop();
    }

    void InvocationWorker::run() {
        for (;;) {
            try {
                ioContext.run();
                return;
            } catch (const std::exception& e) {
                Log::error(label + ": handler raised: " + e.what());
            }
        }
    }

    void InvocationWorker::post(std::function<void()> task) {
        boost::asio::post(ioContext, std::move(task));
    }

    void InvocationWorker::stop() {
        if (!ioThread.joinable()) return;
        if (onWorkerThread()) {
            throw SessionError(SessionError::Code::InvalidState, label + ": worker cannot stop itself");
        }
        work.reset();
        boost::asio::post(ioContext, [this]() { ioContext.stop(); });
        ioThread.join();
    }

    bool InvocationWorker::running() const {
        return ioThread.joinable();
    }

    bool InvocationWorker::onWorkerThread() const {
        return std::this_thread::get_id() == ioThread.get_id();
    }
}
