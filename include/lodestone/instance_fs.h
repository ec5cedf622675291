#pragma once

#include <string>
#include <vector>

#include "lodestone/filesystem.h"
#include "lodestone/orchestrator.h"
#include "lodestone/types.h"

// File access inside an instance directory. Paths are resolved with
// scoped_join(); writes and removals refuse protected files.

std::vector<FileEntry> list_instance_files(InstanceManager& manager,
                                           const std::string& token,
                                           const InstanceUuid& uuid,
                                           const std::string& relative_path);

std::string read_instance_file(InstanceManager& manager,
                               const std::string& token,
                               const InstanceUuid& uuid,
                               const std::string& relative_path);

void write_instance_file(InstanceManager& manager,
                         const std::string& token,
                         const InstanceUuid& uuid,
                         const std::string& relative_path,
                         const std::string& content);

void make_instance_directory(InstanceManager& manager,
                             const std::string& token,
                             const InstanceUuid& uuid,
                             const std::string& relative_path);

void remove_instance_file(InstanceManager& manager,
                          const std::string& token,
                          const InstanceUuid& uuid,
                          const std::string& relative_path);
