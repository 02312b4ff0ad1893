#ifndef CMDQ_CMDQ_HPP
#define CMDQ_CMDQ_HPP

#include "alias.hpp"
#include "binder.hpp"
#include "command_executor.hpp"
#include "command_queue.hpp"
#include "config.hpp"
#include "context.hpp"
#include "converter.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "metadata.hpp"
#include "output.hpp"
#include "pipeline.hpp"
#include "registry.hpp"
#include "tokenizer.hpp"
#include "value.hpp"
#include "worker_pool.hpp"

#endif // CMDQ_CMDQ_HPP
