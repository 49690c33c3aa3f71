#include "termbar/progress/output_lock.hpp"

namespace termbar {
namespace progress {

void MutexOutputLock::lock() {
    mtx_.lock();
}

void MutexOutputLock::unlock() {
    mtx_.unlock();
}

bool MutexOutputLock::try_lock() {
    return mtx_.try_lock();
}

}}
