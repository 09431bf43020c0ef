#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorup/context.hpp>
#include <mirrorup/probe.hpp>
#include <mirrorup/utils.hpp>

#include "curl_internal.hpp"

namespace mirrorup
{
    namespace
    {
        const long MAX_WAIT_MSECS = 1000;

        MirrorupError probe_failure(const std::string& url, const std::string& reason)
        {
            return MirrorupError{ ErrorLevel::INFO,
                                  ErrorCode::MU_PROBE,
                                  fmt::format("{}: {}", url, reason) };
        }

        tl::expected<double, MirrorupError> transfer_rate(const std::string& url,
                                                          const Response& response)
        {
            if (!response.ok())
            {
                return tl::unexpected(
                    probe_failure(url, fmt::format("HTTP status {}", response.http_status)));
            }
            if (response.content_length < 0)
            {
                return tl::unexpected(probe_failure(url, "no content length"));
            }
            if (response.total_time <= 0)
            {
                return tl::unexpected(probe_failure(url, "no transfer time"));
            }

            const double seconds = static_cast<double>(response.total_time) / 1e6;
            const double rate = static_cast<double>(response.content_length) / seconds;
            spdlog::debug("{} -> {:.0f} B/s", url, rate);
            return rate;
        }

        void store_result(MirrorRecord& mirror,
                          tl::expected<double, MirrorupError> rate,
                          std::optional<MirrorupError>& failure)
        {
            if (rate)
            {
                mirror.transfer_rate = rate.value();
            }
            else
            {
                mirror.transfer_rate = std::nullopt;
                failure = std::move(rate.error());
            }
        }

        std::vector<MirrorupError> collect_failures(
            std::vector<std::optional<MirrorupError>>& slots)
        {
            std::vector<MirrorupError> result;
            for (auto& f : slots)
            {
                if (f)
                {
                    f->log();
                    result.push_back(std::move(f.value()));
                }
            }
            return result;
        }
    }

    std::string probe_url(const MirrorRecord& mirror, TargetRepository repo)
    {
        return join_url(mirror.url, database_path(repo));
    }

    /*************
     * ProbePool *
     *************/

    ProbePool::ProbePool(const Context& ctx, std::size_t workers)
        : m_ctx(ctx)
        , m_multi_handle(curl_multi_init())
        , m_workers(std::max<std::size_t>(workers, 1))
    {
        if (m_multi_handle == nullptr)
        {
            throw std::runtime_error("curl_multi_init() failed");
        }
        curl_multi_setopt(
            m_multi_handle, CURLMOPT_MAX_TOTAL_CONNECTIONS, static_cast<long>(m_workers));
    }

    ProbePool::~ProbePool()
    {
        curl_multi_cleanup(m_multi_handle);
    }

    void ProbePool::start_transfers(Mirrors& mirrors, TargetRepository repo)
    {
        while (m_running < m_workers && m_next < mirrors.size())
        {
            const std::size_t idx = m_next++;
            const std::string url = probe_url(mirrors[idx], repo);
            spdlog::debug("Benchmarking {}", url);

            try
            {
                auto handle = std::make_unique<CURLHandle>(m_ctx, url);
                handle->insecure();
                handle->discard_content();
                handle->setopt(CURLOPT_TIMEOUT, m_ctx.probe_timeout);
                handle->setopt(CURLOPT_NOPROXY, "*");
                handle->setopt(CURLOPT_PRIVATE,
                               reinterpret_cast<void*>(static_cast<std::uintptr_t>(idx)));

                CURLMcode code = curl_multi_add_handle(m_multi_handle, handle->handle());
                if (code != CURLM_OK)
                {
                    throw curl_error(curl_multi_strerror(code));
                }
                m_transfers[idx] = std::move(handle);
                ++m_running;
            }
            catch (const curl_error& e)
            {
                store_result(mirrors[idx],
                             tl::unexpected(probe_failure(url, e.what())),
                             m_failures[idx]);
            }
        }
    }

    void ProbePool::finish_transfer(MirrorRecord& mirror, std::size_t idx, CURLcode result)
    {
        CURLHandle& handle = *m_transfers[idx];
        curl_multi_remove_handle(m_multi_handle, handle.handle());

        tl::expected<double, MirrorupError> rate;
        if (result != CURLE_OK)
        {
            rate = tl::unexpected(
                probe_failure(handle.effective_url(), handle.error_message(result)));
        }
        else
        {
            const Response response = handle.finish_transfer();
            rate = transfer_rate(response.effective_url, response);
        }
        store_result(mirror, std::move(rate), m_failures[idx]);

        m_transfers[idx].reset();
        --m_running;
    }

    void ProbePool::abort_transfers(Mirrors& mirrors, const std::string& reason)
    {
        for (std::size_t idx = 0; idx < m_transfers.size(); ++idx)
        {
            if (m_transfers[idx])
            {
                curl_multi_remove_handle(m_multi_handle, m_transfers[idx]->handle());
                m_transfers[idx].reset();
                store_result(mirrors[idx],
                             tl::unexpected(probe_failure(mirrors[idx].url, reason)),
                             m_failures[idx]);
            }
        }
        for (; m_next < mirrors.size(); ++m_next)
        {
            store_result(mirrors[m_next],
                         tl::unexpected(probe_failure(mirrors[m_next].url, reason)),
                         m_failures[m_next]);
        }
        m_running = 0;
    }

    std::vector<MirrorupError> ProbePool::run(Mirrors& mirrors, TargetRepository repo)
    {
        spdlog::info("Benchmarking {} mirrors, {} at a time", mirrors.size(), m_workers);

        m_transfers.clear();
        m_transfers.resize(mirrors.size());
        m_failures.assign(mirrors.size(), std::nullopt);
        m_next = 0;
        m_running = 0;

        start_transfers(mirrors, repo);

        int still_running = 0;
        int repeats = 0;
        while (m_running > 0)
        {
            CURLMcode code = curl_multi_perform(m_multi_handle, &still_running);
            if (code != CURLM_OK)
            {
                abort_transfers(mirrors, curl_multi_strerror(code));
                break;
            }

            int msgs_in_queue;
            while (CURLMsg* msg = curl_multi_info_read(m_multi_handle, &msgs_in_queue))
            {
                if (msg->msg != CURLMSG_DONE)
                {
                    continue;
                }

                // msg does not survive curl_multi_remove_handle
                const CURLcode result = msg->data.result;
                char* priv = nullptr;
                curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
                const auto idx = static_cast<std::size_t>(reinterpret_cast<std::uintptr_t>(priv));

                finish_transfer(mirrors[idx], idx, result);
            }

            start_transfers(mirrors, repo);
            if (m_running == 0)
            {
                break;
            }

            int numfds = 0;
            code = curl_multi_wait(m_multi_handle, nullptr, 0, MAX_WAIT_MSECS, &numfds);
            if (code != CURLM_OK)
            {
                abort_transfers(mirrors, curl_multi_strerror(code));
                break;
            }

            if (!numfds)
            {
                // count number of repeated zero numfds
                repeats++;
                if (repeats > 1)
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            }
            else
            {
                repeats = 0;
            }
        }

        m_transfers.clear();
        return collect_failures(m_failures);
    }

    std::vector<MirrorupError> probe_all(Mirrors& mirrors,
                                         TargetRepository repo,
                                         const probe_function& probe)
    {
        spdlog::info("Benchmarking {} mirrors", mirrors.size());

        std::vector<std::optional<MirrorupError>> failures(mirrors.size());
        for (std::size_t i = 0; i < mirrors.size(); ++i)
        {
            tl::expected<double, MirrorupError> rate;
            try
            {
                rate = probe(mirrors[i], repo);
            }
            catch (const std::exception& e)
            {
                rate = tl::unexpected(probe_failure(mirrors[i].url, e.what()));
            }
            store_result(mirrors[i], std::move(rate), failures[i]);
        }
        return collect_failures(failures);
    }
}
