#pragma once
/**
 * @file core.hpp
 * @brief Main include file for chain_ik
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/common/Errors.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/config/UrdfParser.hpp"
#include "../../src/kinematics/Chain.hpp"
#include "../../src/ik/ParameterSpaceMapper.hpp"
#include "../../src/ik/BoundsAdapter.hpp"
#include "../../src/ik/OrientationMode.hpp"
#include "../../src/ik/IkObjective.hpp"
#include "../../src/ik/InverseKinematicsSolver.hpp"
#include "../../src/ik/KinematicsService.hpp"
#include "../../src/optim/CeresBoundedOptimizer.hpp"

#ifdef CHAIN_IK_HAS_KDL
#include "../../src/kinematics/KdlChainBridge.hpp"
#endif
