#include "kube_objects.hpp"

#include <cctype>

namespace releaselog::cluster {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Struct* StructAt(const Struct& object, std::string_view dotted_path) {
  const auto* v = FindPath(object, dotted_path);
  if (!v || v->kind_case() != Value::kStructValue) return nullptr;
  return &v->struct_value();
}

const google::protobuf::ListValue* ListAt(const Struct& object, std::string_view dotted_path) {
  const auto* v = FindPath(object, dotted_path);
  if (!v || v->kind_case() != Value::kListValue) return nullptr;
  return &v->list_value();
}

model::Labels StringMapAt(const Struct& object, std::string_view dotted_path) {
  model::Labels out;
  if (const auto* s = StructAt(object, dotted_path)) {
    for (const auto& [key, value] : s->fields()) {
      if (value.kind_case() == Value::kStringValue) {
        out.emplace(key, value.string_value());
      }
    }
  }
  return out;
}

std::vector<std::string> ContainerFieldAt(const Struct& object, std::string_view dotted_path, std::string_view field) {
  std::vector<std::string> out;
  if (const auto* list = ListAt(object, dotted_path)) {
    for (const auto& item : list->values()) {
      if (item.kind_case() != Value::kStructValue) continue;
      auto value = StringAt(item.struct_value(), field);
      if (!value.empty()) out.push_back(std::move(value));
    }
  }
  return out;
}

// Adds the containers listed under `dotted_path` whose state is terminated.
void CollectTerminated(const Struct& object, std::string_view dotted_path, std::set<std::string>& out) {
  const auto* statuses = ListAt(object, dotted_path);
  if (!statuses) return;
  for (const auto& item : statuses->values()) {
    if (item.kind_case() != Value::kStructValue) continue;
    const auto& status = item.struct_value();
    if (StructAt(status, "state.terminated")) {
      auto name = StringAt(status, "name");
      if (!name.empty()) out.insert(std::move(name));
    }
  }
}

model::SelectorOperator ParseOperator(const std::string& op) {
  if (op == "In") return model::SelectorOperator::kIn;
  if (op == "NotIn") return model::SelectorOperator::kNotIn;
  if (op == "DoesNotExist") return model::SelectorOperator::kDoesNotExist;
  return model::SelectorOperator::kExists;
}

} // namespace

std::vector<const Struct*> ListItems(const Struct& list) {
  std::vector<const Struct*> out;
  if (const auto* items = ListAt(list, "items")) {
    out.reserve(items->values_size());
    for (const auto& item : items->values()) {
      if (item.kind_case() == Value::kStructValue) {
        out.push_back(&item.struct_value());
      }
    }
  }
  return out;
}

const Value* FindPath(const Struct& object, std::string_view dotted_path) {
  const Struct* current = &object;
  const Value*  found   = nullptr;

  while (true) {
    const auto dot = dotted_path.find('.');
    const auto key = std::string(dotted_path.substr(0, dot));

    auto it = current->fields().find(key);
    if (it == current->fields().end()) return nullptr;
    found = &it->second;

    if (dot == std::string_view::npos) return found;
    if (found->kind_case() != Value::kStructValue) return nullptr;

    current     = &found->struct_value();
    dotted_path = dotted_path.substr(dot + 1);
  }
}

std::string StringAt(const Struct& object, std::string_view dotted_path) {
  const auto* v = FindPath(object, dotted_path);
  if (!v || v->kind_case() != Value::kStringValue) return {};
  return v->string_value();
}

model::LabelSelector DecodeLabelSelector(const Struct& selector) {
  model::LabelSelector out = model::LabelSelector::FromMatchLabels(StringMapAt(selector, "matchLabels"));

  if (const auto* expressions = ListAt(selector, "matchExpressions")) {
    for (const auto& item : expressions->values()) {
      if (item.kind_case() != Value::kStructValue) continue;
      const auto& expr = item.struct_value();

      model::SelectorRequirement req;
      req.key = StringAt(expr, "key");
      req.op  = ParseOperator(StringAt(expr, "operator"));
      if (const auto* values = ListAt(expr, "values")) {
        for (const auto& v : values->values()) {
          if (v.kind_case() == Value::kStringValue) req.values.push_back(v.string_value());
        }
      }
      if (!req.key.empty()) out.AddRequirement(std::move(req));
    }
  }
  return out;
}

model::Pod DecodePod(const Struct& object) {
  model::Pod pod;
  pod.name            = StringAt(object, "metadata.name");
  pod.namespace_      = StringAt(object, "metadata.namespace");
  pod.labels          = StringMapAt(object, "metadata.labels");
  pod.init_containers = ContainerFieldAt(object, "spec.initContainers", "name");
  pod.containers      = ContainerFieldAt(object, "spec.containers", "name");
  pod.phase           = StringAt(object, "status.phase");
  CollectTerminated(object, "status.initContainerStatuses", pod.terminated_containers);
  CollectTerminated(object, "status.containerStatuses", pod.terminated_containers);
  return pod;
}

model::ResourceObject DecodeResourceObject(const Struct& object) {
  model::ResourceObject out;
  out.api_version = StringAt(object, "apiVersion");
  out.kind        = StringAt(object, "kind");
  out.namespace_  = StringAt(object, "metadata.namespace");
  out.name        = StringAt(object, "metadata.name");
  out.labels      = StringMapAt(object, "metadata.labels");
  out.annotations = StringMapAt(object, "metadata.annotations");

  if (const auto* owners = ListAt(object, "metadata.ownerReferences")) {
    for (const auto& item : owners->values()) {
      if (item.kind_case() != Value::kStructValue) continue;
      out.owner_references.push_back({StringAt(item.struct_value(), "kind"), StringAt(item.struct_value(), "name")});
    }
  }

  // Pod templates (Deployment, ReplicaSet, Job) carry images one level down.
  for (const char* path : {"spec.template.spec.initContainers", "spec.template.spec.containers", "spec.containers"}) {
    auto images = ContainerFieldAt(object, path, "image");
    out.container_images.insert(out.container_images.end(), images.begin(), images.end());
  }

  if (const auto* selector = StructAt(object, "spec.selector")) {
    out.selector = DecodeLabelSelector(*selector);
  }

  out.release_name = StringAt(object, "spec.rolloutName");
  out.job_name     = StringAt(object, "status.jobName");
  return out;
}

DescriptorCandidate DecodeDescriptorCandidate(const Struct& kustomization) {
  DescriptorCandidate out;
  out.descriptor.namespace_    = StringAt(kustomization, "metadata.namespace");
  out.descriptor.name          = StringAt(kustomization, "metadata.name");
  out.descriptor.substitutions = StringMapAt(kustomization, "spec.postBuild.substitute");
  out.annotations              = StringMapAt(kustomization, "metadata.annotations");
  out.source_kind              = StringAt(kustomization, "spec.sourceRef.kind");
  out.source_name              = StringAt(kustomization, "spec.sourceRef.name");
  return out;
}

std::string DecodeWantedRevision(const Struct& release) {
  const auto* history = ListAt(release, "status.history");
  if (!history || history->values_size() == 0) return {};

  const auto& latest = history->values(0);
  if (latest.kind_case() != Value::kStructValue) return {};
  return StringAt(latest.struct_value(), "version.tag");
}

std::optional<model::ManagedResource> ParseInventoryEntry(std::string_view id, std::string_view version) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  for (auto pos = id.find('_'); pos != std::string_view::npos; pos = id.find('_', start)) {
    parts.push_back(id.substr(start, pos - start));
    start = pos + 1;
  }
  parts.push_back(id.substr(start));

  if (parts.size() != 4 || parts[1].empty() || parts[3].empty()) {
    return std::nullopt;
  }

  model::ManagedResource out;
  out.namespace_ = std::string(parts[0]);
  out.name       = std::string(parts[1]);

  // group/version/kind; the core group renders as "/v1/Kind"
  out.group_version_kind.append(parts[2]).append("/").append(version).append("/").append(parts[3]);
  return out;
}

std::vector<model::ManagedResource> DecodeInventory(const Struct& kustomization) {
  std::vector<model::ManagedResource> out;
  const auto*                         entries = ListAt(kustomization, "status.inventory.entries");
  if (!entries) return out;

  for (const auto& item : entries->values()) {
    if (item.kind_case() != Value::kStructValue) continue;
    auto parsed = ParseInventoryEntry(StringAt(item.struct_value(), "id"), StringAt(item.struct_value(), "v"));
    if (parsed) out.push_back(std::move(*parsed));
  }
  return out;
}

std::string PluralForKind(std::string_view kind) {
  std::string lower;
  lower.reserve(kind.size() + 2);
  for (char c : kind) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (lower.empty()) return lower;
  if (lower.back() == 'y' && lower.size() > 1 && std::string_view("aeiou").find(lower[lower.size() - 2]) == std::string_view::npos) {
    lower.pop_back();
    return lower + "ies";
  }
  if (lower.back() == 's' || lower.back() == 'x') return lower + "es";
  return lower + "s";
}

} // namespace releaselog::cluster
