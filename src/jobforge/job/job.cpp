#include "jobforge/job/job.hpp"

#include "jobforge/util/log.hpp"

namespace jobforge {

auto validate_job(const Job &job) -> Result<void> {
  if (!is_valid_id_text(job.id.value())) {
    return fail(Error::InvalidArgument);
  }
  if (job.schedule && job.schedule->iso8601_schedule.empty() &&
      !job.schedule->iso8601_min_delta.empty()) {
    log::warn("Job {} has a min delta but no schedule", job.id);
    return fail(Error::ConfigurationError);
  }
  if (auto r = job.actions.validate(); !r) {
    log::warn("Job {} has an invalid action: {}", job.id, r.error().message());
    return r;
  }
  return ok();
}

auto JobBuilder::build() && -> Result<Job> {
  if (auto r = validate_job(job_); !r) {
    return fail(r.error());
  }
  return ok(std::move(job_));
}

} // namespace jobforge
