#pragma once

#include "Messages.hpp"

#include <string>

// Protocol-level checks applied before a value is accepted into the
// pending report. On failure `error` names the offending entry.

bool ValidateAgentDescription(const AgentDescription& description, std::string& error);
bool ValidateHealth(const ComponentHealth& health, std::string& error);
bool ValidateRemoteConfigStatus(const RemoteConfigStatus& status, std::string& error);
bool ValidateEffectiveConfig(const EffectiveConfig& config, std::string& error);
bool ValidatePackageStatuses(const PackageStatuses& statuses, std::string& error);
bool ValidateCustomCapabilities(const CustomCapabilities& capabilities, std::string& error);
bool ValidateCustomMessage(const CustomMessage& message, std::string& error);
