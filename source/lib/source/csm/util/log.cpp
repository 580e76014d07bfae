#include <csm/util/log.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <QDebug>
#include <QString>

#include <fmt/chrono.h>
#include <fmt/ranges.h>

#include <csm/util.hpp>

class Log::LogImpl
{
  public:
    LogImpl(LogFlags log_flags, std::string_view log_name);
    ~LogImpl();

    static Log* GetInstance(std::string_view log_name);

    void RegisterInstance(Log* parent_log);
    void UnregisterInstance();

    static bool RegisterThreadName(std::string_view thread_name);
    static std::string_view GetThreadName(const std::thread::id& thread_id);

    uint32_t InstallHook(Log::LogHook hook);
    void UninstallHook(uint32_t hook_id);

    bool GetStacktraceEnabled(Log::LogLevel level) const;

    void Print(const Log::DetailInformation& detail_info, Log::LogLevel level, const char* message);

  private:
    void Flush(const DetailInformation& detail_info, LogLevel level, const char* message);

    void CreateLogFile();

    Log* m_ParentLog{ nullptr };

    const std::string m_LogName;
    std::mutex m_Mutex;

    struct InstalledLogHook
    {
        uint32_t m_HookId;
        Log::LogHook m_Hook;
    };
    std::vector<InstalledLogHook> m_LogHooks;
    uint32_t m_NextHookId{ 1 };

    std::ofstream m_FileStream;

    const LogFlags m_LogFlags;

    inline static std::shared_mutex g_InstanceListMutex;
    inline static std::unordered_map<std::string, LogImpl*> g_Instances;

    inline static std::shared_mutex g_ThreadListMutex;
    inline static std::unordered_map<std::thread::id, std::string> g_ThreadList;
};

Log::Log(LogFlags log_flags, std::string_view log_name)
    : m_Impl{ std::make_unique<LogImpl>(log_flags, log_name) }
{
    m_Impl->RegisterInstance(this);
}

Log::~Log() = default;

Log* Log::GetInstance(std::string_view log_name)
{
    return LogImpl::GetInstance(log_name);
}

bool Log::RegisterThreadName(std::string_view thread_name)
{
    return LogImpl::RegisterThreadName(thread_name);
}

std::string_view Log::GetThreadName(const std::thread::id& thread_id)
{
    return LogImpl::GetThreadName(thread_id);
}

uint32_t Log::InstallHook(LogHook hook)
{
    return m_Impl->InstallHook(std::move(hook));
}
void Log::UninstallHook(uint32_t hook_id)
{
    m_Impl->UninstallHook(hook_id);
}

bool Log::GetStacktraceEnabled(LogLevel level) const
{
    return m_Impl->GetStacktraceEnabled(level);
}

void Log::PrintRaw(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    m_Impl->Print(detail_info, level, message);
}

Log::LogImpl::LogImpl(LogFlags log_flags, std::string_view log_name)
    : m_LogName(log_name)
    , m_LogFlags(log_flags)
{
    if (IsAnySet(m_LogFlags, LogFlags::File))
    {
        CreateLogFile();
    }
}

Log::LogImpl::~LogImpl()
{
    UnregisterInstance();
}

Log* Log::LogImpl::GetInstance(std::string_view log_name)
{
    std::shared_lock<std::shared_mutex> read_lock(g_InstanceListMutex);

    auto it{ g_Instances.find(std::string{ log_name }) };
    if (it != g_Instances.end())
    {
        return it->second->m_ParentLog;
    }
    return nullptr;
}

void Log::LogImpl::RegisterInstance(Log* parent_log)
{
    UnregisterInstance();

    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);
    if (g_Instances.contains(m_LogName))
    {
        throw std::logic_error{ fmt::format("Log-Name Redefinition: {}", m_LogName) };
    }

    m_ParentLog = parent_log;
    g_Instances[m_LogName] = this;
}
void Log::LogImpl::UnregisterInstance()
{
    std::unique_lock<std::shared_mutex> write_lock(g_InstanceListMutex);

    auto it{ g_Instances.find(m_LogName) };
    if (it != g_Instances.end() && it->second == this)
    {
        g_Instances.erase(it);
    }
    m_ParentLog = nullptr;
}

bool Log::LogImpl::RegisterThreadName(std::string_view thread_name)
{
    std::unique_lock<std::shared_mutex> write_lock(g_ThreadListMutex);

    const std::thread::id thread_id{ std::this_thread::get_id() };
    if (g_ThreadList.contains(thread_id))
    {
        return false;
    }

    g_ThreadList[thread_id] = thread_name;
    return true;
}

std::string_view Log::LogImpl::GetThreadName(const std::thread::id& thread_id)
{
    std::shared_lock<std::shared_mutex> read_lock(g_ThreadListMutex);

    auto it{ g_ThreadList.find(thread_id) };
    if (it != g_ThreadList.end())
    {
        return it->second;
    }

    return "Unregistered";
}

uint32_t Log::LogImpl::InstallHook(Log::LogHook hook)
{
    std::lock_guard lock{ m_Mutex };
    m_LogHooks.push_back({ m_NextHookId++, std::move(hook) });
    return m_LogHooks.back().m_HookId;
}

void Log::LogImpl::UninstallHook(uint32_t hook_id)
{
    std::lock_guard lock{ m_Mutex };
    std::erase_if(m_LogHooks, [hook_id](const InstalledLogHook& hook)
                  { return hook.m_HookId == hook_id; });
}

bool Log::LogImpl::GetStacktraceEnabled(LogLevel level) const
{
    return (level == LogLevel::Error && IsAnySet(m_LogFlags, LogFlags::DetailErrorStacktrace)) ||
           (level == LogLevel::Fatal && IsAnySet(m_LogFlags, LogFlags::DetailFatalStacktrace));
}

void Log::LogImpl::Print(const Log::DetailInformation& detail_info, Log::LogLevel level, const char* message)
{
    Flush(detail_info, level, message);

    if (IsAnySet(m_LogFlags, LogFlags::FatalQuit) && level == LogLevel::Fatal)
    {
        std::exit(-1);
    }
}

void Log::LogImpl::Flush(const DetailInformation& detail_info, LogLevel level, const char* message)
{
    std::stringstream stream;

    const char* prefix{ "[???]" };
    switch (level)
    {
    case LogLevel::Information:
        prefix = " [INFO]";
        break;
    case LogLevel::Debug:
        prefix = "[DEBUG]";
        break;
    case LogLevel::Warning:
        prefix = " [WARN]";
        break;
    case LogLevel::Error:
        prefix = "[ERROR]";
        break;
    case LogLevel::Fatal:
        prefix = "[FATAL]";
        break;
    }
    stream << prefix;

    // Detailed information, e.g. time, file, line...
    if (IsAnySet(m_LogFlags, LogFlags::DetailAll))
    {
        std::vector<std::string> details;
        if (IsAnySet(m_LogFlags, LogFlags::DetailTime))
        {
            details.push_back(fmt::format("{:%H:%M:%S}", fmt::localtime(detail_info.m_Time)));
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailFile))
        {
            std::string_view file{ detail_info.m_File };
#ifdef CSM_SOURCE_ROOT
            if (file.starts_with(CSM_SOURCE_ROOT))
            {
                file = file.substr(std::strlen(CSM_SOURCE_ROOT));
            }
#endif
            details.emplace_back(file);
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailLine))
        {
            const bool with_column{ (m_LogFlags & LogFlags::DetailColumn) == LogFlags::DetailColumn };
            details.push_back(with_column
                                  ? fmt::format("{}:{}", detail_info.m_Line, detail_info.m_Column)
                                  : fmt::format("{}", detail_info.m_Line));
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailFunction))
        {
            details.emplace_back(detail_info.m_Function);
        }
        if (IsAnySet(m_LogFlags, LogFlags::DetailThread))
        {
            details.emplace_back(detail_info.m_Thread);
        }
        stream << "<" << fmt::format("{}", fmt::join(details, "; ")) << ">";
    }

    stream << ": " << message << "\n";

    if (GetStacktraceEnabled(level))
    {
        if (!detail_info.m_StackTrace.empty())
        {
            stream << "Stacktrace:\n";
            for (std::string_view stack_element : detail_info.m_StackTrace)
            {
                stream << stack_element << "\n";
            }
        }
        else
        {
            stream << "[[Stacktrace not available]]\n";
        }
    }

    const std::string full_message_str{ stream.str() };
    std::lock_guard lock{ m_Mutex };

    if (IsAnySet(m_LogFlags, LogFlags::Console))
    {
        qDebug().noquote() << QString::fromStdString(full_message_str).trimmed();
    }
    if (m_FileStream.is_open())
    {
        m_FileStream << full_message_str << std::flush;
    }

    for (const InstalledLogHook& hook : m_LogHooks)
    {
        hook.m_Hook(detail_info, level, message);
    }
}

void Log::LogImpl::CreateLogFile()
{
    const fs::path logs_directory{ fs::absolute("logs") };
    if (!fs::is_directory(logs_directory))
    {
        if (fs::exists(logs_directory))
        {
            fs::remove_all(logs_directory);
        }
        fs::create_directories(logs_directory);
    }

    std::multimap<fs::file_time_type, fs::path> files_sorted_by_modify_time;
    for (const auto& entry : fs::directory_iterator(logs_directory))
    {
        if (entry.is_regular_file())
        {
            files_sorted_by_modify_time.insert({ entry.last_write_time(), entry.path() });
        }
    }

    static constexpr std::size_t c_MaxNumLogFiles{ 256 };
    auto it{ files_sorted_by_modify_time.begin() };
    for (std::size_t num_files = files_sorted_by_modify_time.size(); num_files >= c_MaxNumLogFiles; --num_files, ++it)
    {
        fs::remove(it->second);
    }

    const auto log_file_name{
        fmt::format("{:%Y-%m-%d_%H-%M-%S}_{}.log", fmt::localtime(std::time(nullptr)), m_LogName),
    };
    std::lock_guard lock{ m_Mutex };
    m_FileStream.open(logs_directory / log_file_name);
}
