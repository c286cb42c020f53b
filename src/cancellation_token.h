#pragma once
#include <atomic>
#include <memory>

// Shared per-batch cancel flag. Workers hold copies and only observe it;
// the engine that created it is the only party that sets it.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic_bool>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic_bool> m_flag;
};
