#pragma once

#include <atomic>
#include <memory>

namespace lookout {

// Copies share one flag, so a token handed to worker threads observes cancel() from the owner.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { m_flag->store(true); }
    bool cancelled() const noexcept { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace lookout
