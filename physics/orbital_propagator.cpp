#include "physics/orbital_propagator.hpp"

#include <algorithm>
#include <deque>
#include <utility>

#include "glog/logging.h"

namespace orrery {
namespace physics {
namespace internal_orbital_propagator {

using base::make_not_null_unique;
using base::ParallelForEach;

OrbitalPropagator::OrbitalPropagator(BodyCatalog const& catalog) {
  bodies_.reserve(catalog.bodies().size());
  for (auto const& record : catalog.bodies()) {
    auto celestial = make_not_null_unique<Celestial>(record);
    if (record.parent.has_value()) {
      auto const it = index_.find(*record.parent);
      CHECK(it != index_.end()) << record.id;
      celestial->set_parent(bodies_[it->second].get());
    }
    index_.emplace(record.id, bodies_.size());
    bodies_.push_back(std::move(celestial));
  }
  Propagate(/*t=*/0);
  for (auto const& body : bodies_) {
    system_size_ = std::max(system_size_, body->position().Norm());
  }
  LOG(INFO) << "System of " << bodies_.size() << " bodies around "
            << primary().id() << ", size " << system_size_ << " km";
}

void OrbitalPropagator::Propagate(double const t,
                                  ThreadPool<void>* const pool) {
  ParallelForEach(pool,
                  bodies_,
                  [t](not_null<std::unique_ptr<Celestial>>& body) {
                    body->orbit().Update(t);
                  });
  ComposeDegreesOfFreedom();
}

std::vector<not_null<std::unique_ptr<Celestial>>> const&
OrbitalPropagator::bodies() const {
  return bodies_;
}

Celestial const& OrbitalPropagator::primary() const {
  return *bodies_.front();
}

Celestial const* OrbitalPropagator::FindBody(std::string_view const id) const {
  auto const it = index_.find(id);
  if (it == index_.end()) {
    return nullptr;
  }
  return bodies_[it->second].get();
}

double OrbitalPropagator::system_size() const {
  return system_size_;
}

void OrbitalPropagator::ComposeDegreesOfFreedom() {
  // Each entry holds a body and the state of its parent.
  std::deque<std::pair<not_null<Celestial*>, DegreesOfFreedom>> queue;
  queue.emplace_back(bodies_.front().get(), DegreesOfFreedom{});
  while (!queue.empty()) {
    auto const [body, parent_degrees_of_freedom] = queue.front();
    queue.pop_front();
    DegreesOfFreedom const degrees_of_freedom =
        parent_degrees_of_freedom + body->orbit().local_degrees_of_freedom();
    body->set_degrees_of_freedom(degrees_of_freedom);
    for (not_null<Celestial*> const child : body->children()) {
      queue.emplace_back(child, degrees_of_freedom);
    }
  }
}

}  // namespace internal_orbital_propagator
}  // namespace physics
}  // namespace orrery
