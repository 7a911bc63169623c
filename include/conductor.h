// conductor.h
#pragma once

// Public entry point: event bus, agent router, workflow coordinator and the
// resilience primitives they share

#include "conductor/failure.h"
#include "conductor/params.h"
#include "conductor/message.h"
#include "conductor/event.h"
#include "conductor/agent.h"
#include "conductor/cache.h"
#include "conductor/knowledge.h"
#include "conductor/ratelimit.h"
#include "conductor/registry.h"
#include "conductor/workflow.h"
#include "conductor/context.h"
#include "log.h"
