#include "app/Registry.hpp"

namespace devtel::app {

Registry& Registry::global() {
  static Registry reg;
  return reg;
}

Registry::~Registry() {
  stop_all();
  // Providers hold raw pointers into backends_; drop them first
  temp_.clear(); mem_.clear(); usage_.clear();
  backends_.clear();
}

void Registry::register_startup(std::string name, StartupFn fn) {
  std::lock_guard<std::mutex> lk(mu_);
  startups_.push_back(Startup{std::move(name), std::move(fn)});
}

void Registry::register_temp(TempProvider fn) {
  std::lock_guard<std::mutex> lk(mu_);
  temp_.push_back(std::move(fn));
}

void Registry::register_mem(MemProvider fn) {
  std::lock_guard<std::mutex> lk(mu_);
  mem_.push_back(std::move(fn));
}

void Registry::register_usage(UsageProvider fn) {
  std::lock_guard<std::mutex> lk(mu_);
  usage_.push_back(std::move(fn));
}

std::vector<devtel::model::Error> Registry::run_startups(const devtel::model::ConfigMap& cfg) {
  std::vector<Startup> list;
  {
    std::lock_guard<std::mutex> lk(mu_);
    list = startups_;
  }
  // Sequential on the caller's thread; startups call back into register_*
  std::vector<devtel::model::Error> errors;
  for (const auto& s : list) {
    if (auto err = s.fn(cfg, *this)) errors.push_back(s.name + ": " + *err);
  }
  return errors;
}

Backend& Registry::adopt(std::unique_ptr<Backend> backend) {
  std::lock_guard<std::mutex> lk(mu_);
  backends_.push_back(std::move(backend));
  return *backends_.back();
}

devtel::model::ErrorMap Registry::temps(devtel::model::TempMap& out) const {
  std::vector<TempProvider> fns;
  { std::lock_guard<std::mutex> lk(mu_); fns = temp_; }
  devtel::model::ErrorMap errs;
  for (const auto& fn : fns) {
    for (auto& [k, v] : fn(out)) errs[k] = std::move(v);
  }
  return errs;
}

devtel::model::ErrorMap Registry::mems(devtel::model::MemMap& out) const {
  std::vector<MemProvider> fns;
  { std::lock_guard<std::mutex> lk(mu_); fns = mem_; }
  devtel::model::ErrorMap errs;
  for (const auto& fn : fns) {
    for (auto& [k, v] : fn(out)) errs[k] = std::move(v);
  }
  return errs;
}

devtel::model::ErrorMap Registry::usage(devtel::model::UsageMap& out, bool per_device) const {
  std::vector<UsageProvider> fns;
  { std::lock_guard<std::mutex> lk(mu_); fns = usage_; }
  devtel::model::ErrorMap errs;
  for (const auto& fn : fns) {
    for (auto& [k, v] : fn(out, per_device)) errs[k] = std::move(v);
  }
  return errs;
}

std::vector<std::string> Registry::startup_names() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& s : startups_) out.push_back(s.name);
  return out;
}

std::vector<std::string> Registry::backend_keys() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& b : backends_) out.push_back(b->key());
  return out;
}

size_t Registry::temp_provider_count() const { std::lock_guard<std::mutex> lk(mu_); return temp_.size(); }
size_t Registry::mem_provider_count() const { std::lock_guard<std::mutex> lk(mu_); return mem_.size(); }
size_t Registry::usage_provider_count() const { std::lock_guard<std::mutex> lk(mu_); return usage_.size(); }

void Registry::stop_all() {
  std::vector<Backend*> list;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& b : backends_) list.push_back(b.get());
  }
  for (auto* b : list) b->stop();
}

} // namespace devtel::app
