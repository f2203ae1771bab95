#pragma once

#include "savings/savings.hpp"
