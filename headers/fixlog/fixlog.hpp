#pragma once

#include "aggregators.hpp"
#include "datalog.hpp"
#include "error.hpp"
#include "lattice.hpp"
#include "rule.hpp"
#include "stratify.hpp"
#include "typed.hpp"
#include "value.hpp"
