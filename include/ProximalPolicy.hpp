#pragma once

#ifndef PROXIMALPOLICY_HPP
#define PROXIMALPOLICY_HPP

#include"Algorithms/Algorithm.hpp"
#include"Algorithms/PPO.hpp"

#include"Distribution/Categorical.hpp"
#include"Distribution/Distribution.hpp"
#include"Distribution/Normal.hpp"

#include"Environment/Environment.hpp"
#include"Environment/FrameStack.hpp"

#include"Model/CnnApproximator.hpp"
#include"Model/FunctionApproximator.hpp"
#include"Model/MlpApproximator.hpp"
#include"Model/modelUtils.hpp"
#include"Model/OutputLayers.hpp"
#include"Model/Policy.hpp"

#include"Checkpoint.hpp"
#include"Config.hpp"
#include"Errors.hpp"
#include"Evaluator.hpp"
#include"Metrics.hpp"
#include"Space.hpp"
#include"Storage.hpp"
#include"Trainer.hpp"

#endif //PROXIMALPOLICY_HPP
