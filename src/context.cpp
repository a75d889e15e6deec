#include <atomic>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include <parafetch/context.hpp>
#include <parafetch/utils.hpp>

#include "./curl_internal.hpp"


namespace parafetch
{
    struct Context::Impl
    {
        std::optional<details::CURLSetup> curl_setup;
    };

    static std::atomic<bool> is_context_alive{ false };

    Context::Context(ContextOptions options)
        : impl(new Impl)
    {
        bool expected = false;
        if (!is_context_alive.compare_exchange_strong(expected, true))
            throw std::runtime_error(
                "parafetch::Context created more than once - instance must be unique");

        try
        {
            // curl_global_init is not thread safe, it has to run before any worker starts
            impl->curl_setup.emplace(options.ssl_backend);
        }
        catch (...)
        {
            is_context_alive = false;
            throw;
        }

        user_agent = get_env("PARAFETCH_USER_AGENT", user_agent);
        set_verbosity(0);
    }

    Context::~Context()
    {
        is_context_alive = false;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 1)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::info);
        }
        else
        {
            spdlog::set_level(spdlog::level::warn);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }
}
