#ifndef PSHARE_API_PSHARETRACKER_HPP_
#define PSHARE_API_PSHARETRACKER_HPP_

#include <memory>
#include <string>

#include "pshareapidefs.h"

namespace pshare
{
// Forward declarations
class PShareTrackerImpl;

// Standalone tracker: remembers which peers announced which file hashes and answers peer
// lookups over HTTP. The registry lives in memory only.
class PSHARE_API PShareTracker
{
public:
    explicit PShareTracker(const std::string &config_file_path);
    PShareTracker(PShareTracker &&other) noexcept;
    PShareTracker &operator=(PShareTracker &&rhs) noexcept;
    ~PShareTracker();

    bool                         start();
    void                         stop();
    [[nodiscard]] unsigned short port() const;

private:
    std::unique_ptr<PShareTrackerImpl> impl_;
};
}  // namespace pshare

#endif  // PSHARE_API_PSHARETRACKER_HPP_
