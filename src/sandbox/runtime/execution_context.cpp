//
// NLytics Execution Context Implementation
//

#include "execution_context.h"
#include "sandbox_error.h"
#include <algorithm>
#include <format>
#include <limits>

namespace nlytics::sandbox
{
    namespace
    {
        thread_local const ExecutionContext* t_activeContext = nullptr;
    } // namespace

    ExecutionContext::ExecutionContext(const SandboxConfig& config, OutputCapture& output,
                                       const std::atomic<bool>& preempted, int64_t timeoutMs)
        : m_config(config), m_output(output), m_preempted(preempted), m_timeoutMs(timeoutMs)
    {
    }

    const Value* ExecutionContext::TryLookup(const std::string& name) const
    {
        if (auto it = m_globals.find(name); it != m_globals.end())
        {
            return &it->second;
        }
        if (auto it = m_builtins.find(name); it != m_builtins.end())
        {
            return &it->second;
        }
        return nullptr;
    }

    const Value& ExecutionContext::Lookup(const std::string& name) const
    {
        const Value* value = TryLookup(name);
        if (value == nullptr)
        {
            ThrowFault("NameError", std::format("name '{}' is not defined", name));
        }
        return *value;
    }

    const Value* ExecutionContext::FindGlobal(const std::string& name) const
    {
        auto it = m_globals.find(name);
        return it == m_globals.end() ? nullptr : &it->second;
    }

    void ExecutionContext::Bind(const std::string& name, Value value)
    {
        m_globals.insert_or_assign(name, std::move(value));
    }

    void ExecutionContext::BindBuiltin(const std::string& name, Value value)
    {
        m_builtins.insert_or_assign(name, std::move(value));
    }

    Value ExecutionContext::ImportModule(const std::string& name) const
    {
        if (name.starts_with("."))
        {
            ThrowFault("ImportError", "relative imports are not available in the sandbox");
        }

        const std::string top = name.substr(0, name.find('.'));
        if (std::ranges::find(m_config.allowed_modules, top) == m_config.allowed_modules.end())
        {
            ThrowFault("ImportError", std::format("import of '{}' is not allowed in the sandbox", name));
        }

        auto alias = m_config.module_aliases.find(top);
        if (alias == m_config.module_aliases.end() || top != name)
        {
            ThrowFault("ModuleNotFoundError", std::format("No module named '{}'", name));
        }
        return Value{std::make_shared<ModuleObject>(ModuleObject{alias->second})};
    }

    void ExecutionContext::CheckPreempted() const
    {
        if (Preempted())
        {
            throw TimeoutFaultError(std::format("execution exceeded {} ms", m_timeoutMs));
        }
    }

    void ExecutionContext::CheckSequenceLength(uint64_t items) const
    {
        if (items > m_config.max_sequence_items)
        {
            ThrowFault("MemoryError", std::format("sequence of {} items exceeds the sandbox limit of {}", items,
                                                  m_config.max_sequence_items));
        }
    }

    ActiveRunScope::ActiveRunScope(const ExecutionContext& context) : m_previous(t_activeContext)
    {
        t_activeContext = &context;
    }

    ActiveRunScope::~ActiveRunScope()
    {
        t_activeContext = m_previous;
    }

    void PollPreemption()
    {
        if (t_activeContext != nullptr)
        {
            t_activeContext->CheckPreempted();
        }
    }

    void CheckSequenceLength(uint64_t items)
    {
        if (t_activeContext != nullptr)
        {
            t_activeContext->CheckSequenceLength(items);
        }
    }

    uint64_t RepeatedLength(uint64_t size, int64_t times)
    {
        if (times <= 0)
        {
            return 0;
        }
        uint64_t total = 0;
        if (__builtin_mul_overflow(size, static_cast<uint64_t>(times), &total))
        {
            return std::numeric_limits<uint64_t>::max();
        }
        return total;
    }

} // namespace nlytics::sandbox
