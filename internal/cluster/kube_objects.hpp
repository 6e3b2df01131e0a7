#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/cluster_objects.hpp"
#include "internal/model/label_selector.hpp"

namespace releaselog::cluster {

/*
  Decoding of Kubernetes API objects (as protobuf Struct) into the model.

  Decoders are lenient: absent or mistyped fields decode to empty values,
  the API server being the source of truth for shape.
*/

// Flux Kustomization reduced to what release matching needs.
struct DescriptorCandidate {
  model::Descriptor descriptor;
  model::Labels     annotations;
  std::string       source_kind;
  std::string       source_name;
};

// "items" of a List response.
std::vector<const google::protobuf::Struct*> ListItems(const google::protobuf::Struct& list);

// Dotted lookup ("status.history"), nullptr when any step is missing.
const google::protobuf::Value* FindPath(const google::protobuf::Struct& object, std::string_view dotted_path);
std::string                    StringAt(const google::protobuf::Struct& object, std::string_view dotted_path);

model::LabelSelector  DecodeLabelSelector(const google::protobuf::Struct& selector);
model::Pod            DecodePod(const google::protobuf::Struct& object);
model::ResourceObject DecodeResourceObject(const google::protobuf::Struct& object);
DescriptorCandidate   DecodeDescriptorCandidate(const google::protobuf::Struct& kustomization);

// status.history[0].version.tag, empty when there is no history.
std::string DecodeWantedRevision(const google::protobuf::Struct& release);

// Inventory ids look like "<ns>_<name>_<group>_<kind>"; `version` is the
// entry's "v". Returns nullopt for ids that do not split into four parts.
std::optional<model::ManagedResource> ParseInventoryEntry(std::string_view id, std::string_view version);

std::vector<model::ManagedResource> DecodeInventory(const google::protobuf::Struct& kustomization);

// Lower-case plural resource name for a kind ("Deployment" → "deployments").
std::string PluralForKind(std::string_view kind);

} // namespace releaselog::cluster
