#include "callproc/callproc_c.h"
#include "../config.hpp"
#include "../errors.hpp"
#include "../events/processor.hpp"
#include "../events/registration.hpp"
#include "../handlers/dtmf_validation.hpp"
#include "../logging.hpp"
#include "../services/background.hpp"
#include "../services/memory_store.hpp"

#include <sodium.h>

#include <chrono>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <vector>

using namespace callproc;

/*==============================================================================
 * Internal wrapper structs for opaque handles
 *============================================================================*/

struct callproc_config_t {
    ProcessorConfig config;
};

struct callproc_processor_t {
    events::CallEventProcessor processor;
    services::BackgroundTasks tasks;
    std::shared_ptr<services::MemorySessionStore> store;
    events::CallRuntime runtime;
};

/*==============================================================================
 * Helper functions
 *============================================================================*/

static char* copy_to_c_string(const std::string& str) {
    char* result = new char[str.size() + 1];
    std::memcpy(result, str.c_str(), str.size() + 1);
    return result;
}

static int run_batch(callproc_processor_t* proc,
                     const std::vector<events::EventEnvelope>& batch,
                     char** summary_json) {
    auto summary = proc->processor.process_events(batch, proc->runtime);
    *summary_json = copy_to_c_string(summary.to_json().dump());
    return CALLPROC_OK;
}

/*==============================================================================
 * Init / Utilities
 *============================================================================*/

int callproc_init(void) {
    if (sodium_init() < 0) return CALLPROC_ERR;
    return CALLPROC_OK;
}

void callproc_free_string(char* str) {
    delete[] str;
}

/*==============================================================================
 * Config API
 *============================================================================*/

int callproc_config_from_env_string(const char* env_content, callproc_config_t** out) {
    if (!env_content || !out) return CALLPROC_ERR_INVALID_ARG;

    try {
        auto cfg = std::make_unique<callproc_config_t>();
        cfg->config = ProcessorConfig::from_env_string(std::string(env_content));
        *out = cfg.release();
        return CALLPROC_OK;
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (const ConfigError& e) {
        logging::get_logger("bindings.c")->error("Invalid configuration: {}", e.what());
        return CALLPROC_ERR_PARSE;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

int callproc_config_to_env_string(const callproc_config_t* cfg, char** out) {
    if (!cfg || !out) return CALLPROC_ERR_INVALID_ARG;

    try {
        *out = copy_to_c_string(cfg->config.to_env_string());
        return CALLPROC_OK;
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

void callproc_config_destroy(callproc_config_t* cfg) {
    delete cfg;
}

/*==============================================================================
 * Processor API
 *============================================================================*/

int callproc_processor_create(const callproc_config_t* cfg, callproc_processor_t** out) {
    if (!out) return CALLPROC_ERR_INVALID_ARG;

    try {
        auto proc = std::make_unique<callproc_processor_t>();
        proc->store = std::make_shared<services::MemorySessionStore>();
        proc->runtime.store = proc->store;
        proc->runtime.tasks = &proc->tasks;
        if (cfg) proc->runtime.config = cfg->config;

        logging::set_level(proc->runtime.config.log_level);
        events::register_default_handlers(proc->processor);

        *out = proc.release();
        return CALLPROC_OK;
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

void callproc_processor_destroy(callproc_processor_t* proc) {
    delete proc;
}

int callproc_process_webhook(callproc_processor_t* proc,
                             const char* body,
                             const char* header_call_id,
                             char** summary_json) {
    if (!proc || !body || !summary_json) return CALLPROC_ERR_INVALID_ARG;

    try {
        events::Headers headers;
        if (header_call_id && *header_call_id) {
            headers[events::kCallConnectionIdHeader] = header_call_id;
        }
        auto batch = events::parse_webhook_batch(std::string(body),
                                                 "azure.communication.callautomation",
                                                 headers);
        return run_batch(proc, batch, summary_json);
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

int callproc_process_api_event(callproc_processor_t* proc,
                               const char* event_type,
                               const char* call_id,
                               const char* data_json,
                               char** summary_json) {
    if (!proc || !event_type || !call_id || !summary_json) return CALLPROC_ERR_INVALID_ARG;

    try {
        Json data = Json::object();
        if (data_json && *data_json) {
            data = Json::parse(data_json, nullptr, false);
            if (data.is_discarded() || !data.is_object()) return CALLPROC_ERR_PARSE;
        }
        auto event = events::make_api_event(event_type, call_id, data);
        return run_batch(proc, {event}, summary_json);
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

int callproc_get_active_calls(const callproc_processor_t* proc, char** out_json) {
    if (!proc || !out_json) return CALLPROC_ERR_INVALID_ARG;

    try {
        Json calls = proc->processor.get_active_calls();
        *out_json = copy_to_c_string(calls.dump());
        return CALLPROC_OK;
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

int callproc_get_stats(const callproc_processor_t* proc, char** out_json) {
    if (!proc || !out_json) return CALLPROC_ERR_INVALID_ARG;

    try {
        *out_json = copy_to_c_string(proc->processor.get_stats().dump());
        return CALLPROC_OK;
    } catch (const std::bad_alloc&) {
        return CALLPROC_ERR_ALLOC;
    } catch (...) {
        return CALLPROC_ERR;
    }
}

int callproc_is_gate_open(callproc_processor_t* proc, const char* call_id) {
    if (!proc || !call_id) return CALLPROC_ERR_INVALID_ARG;
    return handlers::is_dtmf_validation_gate_open(proc->store.get(), std::string(call_id)) ? 1 : 0;
}

int callproc_wait_for_validation(callproc_processor_t* proc, const char* call_id, int timeout_ms) {
    if (!proc || !call_id || timeout_ms < 0) return CALLPROC_ERR_INVALID_ARG;
    bool done = handlers::wait_for_dtmf_validation_completion(*proc->store, nullptr, std::string(call_id),
                                                              std::chrono::milliseconds(timeout_ms));
    return done ? 1 : 0;
}
