#pragma once

/** \file worldvault.hpp
 *  \brief Umbrella include for shells embedding the backup core.
 */

#include "worldvault/archive/engine.hpp"
#include "worldvault/backup/naming.hpp"
#include "worldvault/backup/repository.hpp"
#include "worldvault/config.hpp"
#include "worldvault/error.hpp"
#include "worldvault/retention/retention.hpp"
#include "worldvault/service.hpp"
#include "worldvault/world/discovery.hpp"
