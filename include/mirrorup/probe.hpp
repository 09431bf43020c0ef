#ifndef MIRRORUP_PROBE_HPP
#define MIRRORUP_PROBE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <mirrorup/export.hpp>
#include <mirrorup/curl.hpp>
#include <mirrorup/enums.hpp>
#include <mirrorup/errors.hpp>
#include <mirrorup/mirror.hpp>

namespace mirrorup
{
    class Context;

    // Measures one mirror, returns its transfer rate in bytes per second.
    using probe_function
        = std::function<tl::expected<double, MirrorupError>(const MirrorRecord&, TargetRepository)>;

    // `{mirror.url}{repo}/os/x86_64/{repo}.db`
    MIRRORUP_API std::string probe_url(const MirrorRecord& mirror, TargetRepository repo);

    /** Benchmarks mirrors on one curl multi handle.
     * At most `workers` transfers are in flight at any time. Every transfer
     * downloads the repository database (no compression, no proxy, no
     * certificate verification, `ctx.probe_timeout` seconds at most) and the
     * rate is Content-Length divided by the total transfer time.
     */
    class MIRRORUP_API ProbePool
    {
    public:
        ProbePool(const Context& ctx, std::size_t workers);
        ~ProbePool();

        ProbePool(const ProbePool&) = delete;
        ProbePool& operator=(const ProbePool&) = delete;

        std::size_t workers() const noexcept
        {
            return m_workers;
        }

        /** Sets `transfer_rate` of each mirror in place, a failed transfer leaves it unset.
         * @return  the per-mirror failures, never fatal
         */
        std::vector<MirrorupError> run(Mirrors& mirrors, TargetRepository repo);

    private:
        void start_transfers(Mirrors& mirrors, TargetRepository repo);
        void finish_transfer(MirrorRecord& mirror, std::size_t idx, CURLcode result);
        void abort_transfers(Mirrors& mirrors, const std::string& reason);

        const Context& m_ctx;
        CURLM* m_multi_handle;
        std::size_t m_workers;

        // per run state, indexed like the mirrors
        std::vector<std::unique_ptr<CURLHandle>> m_transfers;
        std::vector<std::optional<MirrorupError>> m_failures;
        std::size_t m_next = 0;
        std::size_t m_running = 0;
    };

    /** Benchmarks every mirror with `probe`, one after the other.
     * Same bookkeeping as `ProbePool::run`, an exception thrown by `probe`
     * counts as a failure of that mirror.
     */
    MIRRORUP_API std::vector<MirrorupError> probe_all(Mirrors& mirrors,
                                                      TargetRepository repo,
                                                      const probe_function& probe);
}

#endif
