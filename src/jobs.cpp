#include "swarmsync/jobs.hpp"

#include <stdexcept>

namespace swarmsync {

std::map<config::ConfigVariant, int64_t> run_config_job(ConfigStore& store, const ReceiveJob& job) {
    if (job.kind != ReceiveJob::Kind::config_messages)
        throw std::invalid_argument{"run_config_job: not a config messages job"};

    store.log(
            LogLevel::debug,
            "Processing " + std::to_string(job.configs.size()) + " config message(s) of " +
                    job.target);
    return store.handle_config_messages(job.target, job.configs);
}

}  // namespace swarmsync
