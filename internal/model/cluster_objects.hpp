#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/model/label_selector.hpp"

namespace releaselog::model {

/*
  The slice of cluster state the engine reads. Decoded from API objects by
  the cluster layer; tests build them directly.
*/

struct OwnerReference {
  std::string kind;
  std::string name;
};

struct Pod {
  std::string              name;
  std::string              namespace_;
  Labels                   labels;
  std::vector<std::string> init_containers;
  std::vector<std::string> containers;
  std::string              phase;

  // containers (init or regular) whose current state is terminated
  std::set<std::string> terminated_containers;
};

// Generic managed object: workloads, their generations, jobs and release tests.
struct ResourceObject {
  std::string api_version;
  std::string kind;
  std::string namespace_;
  std::string name;

  Labels                      labels;
  Labels                      annotations;
  std::vector<OwnerReference> owner_references;

  // spec.containers / spec.template.spec.containers images
  std::vector<std::string> container_images;

  // spec.selector, when the object has one
  std::optional<LabelSelector> selector;

  // release tests only
  std::string release_name;
  std::string job_name;
};

// A deployment descriptor associated with a release.
struct Descriptor {
  std::string                        namespace_;
  std::string                        name;
  std::map<std::string, std::string> substitutions;
};

struct ManagedResource {
  std::string group_version_kind; // "apps/v1/Deployment", "/v1/ConfigMap"
  std::string namespace_;
  std::string name;

  std::optional<ResourceObject> object;
};

} // namespace releaselog::model
