#pragma once

#include <mutex>

namespace termbar {
namespace progress {

// Borrowed by bars, never owned. Must outlive every writer using it.
class OutputLock {
public:
    virtual ~OutputLock() = default;

    virtual void lock() = 0;
    virtual void unlock() = 0;
    virtual bool try_lock() = 0;
};

class MutexOutputLock : public OutputLock {
public:
    MutexOutputLock() = default;
    MutexOutputLock(const MutexOutputLock&) = delete;
    MutexOutputLock& operator=(const MutexOutputLock&) = delete;

    void lock() override;
    void unlock() override;
    bool try_lock() override;

private:
    std::mutex mtx_;
};

}}
