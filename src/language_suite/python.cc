#include "sandtool/language_suite/python.hh"
#include "sandtool/macros/throw.hh"

#include <sys/wait.h>
#include <unistd.h>

namespace {

// Exit code the runner uses when an allocation failed. A MemoryError the source raised itself
// exits with 1 like any other uncaught exception.
constexpr int memory_exhaustion_exit_code = 111;

// Runs the source given as argv[1] in a fresh namespace holding the input as input_data. A
// single expression is evaluated and the repr() of its value is written to the result fd.
constexpr char runner[] = R"(import io, opcode, sys
source = sys.argv[1]
del sys.argv[1:]
input_data = sys.stdin.read()
sys.stdin = io.StringIO(input_data)
namespace = {'__name__': '__main__', '__builtins__': __builtins__, 'input_data': input_data}
raise_opcode = opcode.opmap['RAISE_VARARGS']
try:
    try:
        code = compile(source, '<code>', 'eval')
    except SyntaxError:
        code = None
    if code is None:
        exec(compile(source, '<code>', 'exec'), namespace)
    else:
        value = repr(eval(code, namespace))
        with open(3, 'w') as result:
            result.write(value)
except MemoryError as e:
    tb = e.__traceback__
    while tb.tb_next is not None:
        tb = tb.tb_next
    raised = tb.tb_frame.f_code.co_filename == '<code>' and \
        tb.tb_frame.f_code.co_code[tb.tb_lasti] == raise_opcode
    sys.excepthook(type(e), e, e.__traceback__.tb_next)
    sys.stderr.flush()
    sys.exit(1 if raised else 111)
except BaseException as e:
    if isinstance(e, SystemExit):
        raise
    sys.excepthook(type(e), e, e.__traceback__.tb_next)
    sys.exit(1)
)";

std::string_view last_nonempty_line(std::string_view str) noexcept {
    while (not str.empty() and (str.back() == '\n' or str.back() == '\r' or str.back() == ' ')) {
        str.remove_suffix(1);
    }
    auto pos = str.rfind('\n');
    return pos == std::string_view::npos ? str : str.substr(pos + 1);
}

} // namespace

namespace sandtool::language_suite {

Python::Python(std::string interpreter_path)
: interpreter_path_{std::move(interpreter_path)} {}

bool Python::is_supported() const {
    return access(interpreter_path_.c_str(), X_OK) == 0 and sandbox::is_supported();
}

void Python::async_run(std::string_view source, const RunOptions& options) {
    if (running_) {
        THROW("Python: previous run was not awaited");
    }
    running_.emplace(sandbox::execute({
        .limits =
            {
                .real_time = options.time_limit,
                .kill_grace_period = options.kill_grace_period,
                .cpu_time = options.cpu_time_limit,
                .memory_limit = options.memory_limit_in_bytes,
                .stack_size_limit = options.max_stack_size_in_bytes,
                .output_size_limit = options.output_size_limit_in_bytes,
                .max_file_size = 0,
                .allow_file_writes = false,
                .allow_process_creation = false,
                .allow_sockets = false,
            },
        .executable = interpreter_path_,
        // -I: isolated mode, -S: no site module, -B: no .pyc files
        .args = {"python3", "-I", "-S", "-B", "-c", runner, std::string{source}},
        .env = {"LANG=C.UTF-8", "PATH=/usr/bin:/bin"},
        .fs = {.mounts = sandbox::system_mounts()},
        .working_directory = options.working_directory,
        .stdin_data = options.stdin_data,
        .capture_result_fd = true,
    }));
}

bool Python::is_memory_exhaustion(const sandbox::Result& res) const {
    if (res.si.exited_successfully()) {
        return false;
    }
    auto line = last_nonempty_line(res.stderr_data);
    // The interpreter itself could not allocate
    if (line.starts_with("Fatal Python error") and line.find("memory") != std::string_view::npos) {
        return true;
    }
    // Traceback ends with "MemoryError" or "MemoryError: <message>"
    return res.si.code == CLD_EXITED and res.si.status == memory_exhaustion_exit_code and
        line.starts_with("MemoryError");
}

} // namespace sandtool::language_suite
