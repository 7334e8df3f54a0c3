#pragma once

#include "ImagePlanner.h"

Data BuildImage(const ImagePlan& plan);
Data BuildImage(const PlanConfig& config);
