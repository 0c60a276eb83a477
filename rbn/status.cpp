#include "status.h"

namespace rbn
{

const char *status_name(int code)
{
	switch (code)
	{
	case success: return "success";
	case configuration_error: return "configuration error";
	case resource_exceeded: return "resource exceeded";
	case solver_failure: return "solver failure";
	case translation_error: return "translation error";
	}
	return "unknown status";
}

limits::limits()
{
	max_states = (uint64_t)1 << 22;
	max_seconds = 0.0f;
}

limits::limits(uint64_t max_states, float max_seconds)
{
	this->max_states = max_states;
	this->max_seconds = max_seconds;
}

limits::~limits()
{

}

}
