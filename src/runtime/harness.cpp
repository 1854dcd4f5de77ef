#include "runtime/harness.hpp"
#include <fstream>

namespace fs = std::filesystem;

namespace execore::runtime {

// Runs main.py as __main__, prints user-visible tracebacks, and saves any
// open matplotlib figures as plot_<i>.png before exiting
static const char* PYTHON_RUNNER = R"PY(import sys
import traceback

_USER_FILE = 'main.py'


def _save_figures():
    plt = sys.modules.get('matplotlib.pyplot')
    if plt is None:
        return
    for i, num in enumerate(plt.get_fignums()):
        plt.figure(num).savefig('plot_%d.png' % i, format='png', bbox_inches='tight', dpi=100)
    plt.close('all')


def _run():
    with open(_USER_FILE, encoding='utf-8') as f:
        source = f.read()
    scope = {'__name__': '__main__', '__file__': _USER_FILE, '__builtins__': __builtins__}
    status = 0
    try:
        exec(compile(source, _USER_FILE, 'exec'), scope)
    except SystemExit as e:
        if e.code is None:
            status = 0
        elif isinstance(e.code, int):
            status = e.code
        else:
            print(e.code, file=sys.stderr)
            status = 1
    except BaseException:
        etype, value, tb = sys.exc_info()
        while tb is not None and tb.tb_frame.f_code.co_filename != _USER_FILE:
            tb = tb.tb_next
        traceback.print_exception(etype, value, tb)
        status = 1
    finally:
        try:
            _save_figures()
        except Exception as e:
            print('Failed to save figures: %s' % e, file=sys.stderr)
        sys.stdout.flush()
        sys.stderr.flush()
    return status


if __name__ == '__main__':
    sys.exit(_run())
)PY";

static bool write_file(const fs::path& path, const std::string& content, std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        error = "cannot open " + path.string() + " for writing";
        return false;
    }
    out << content;
    out.close();
    if (!out) {
        error = "failed writing " + path.string();
        return false;
    }
    return true;
}

bool write_harness(Language language, const std::string& code, const fs::path& dir,
                   std::vector<std::string>& args, std::string& error) {
    args.clear();

    switch (language) {
        case Language::PYTHON:
            if (!write_file(dir / PYTHON_USER_FILE, code, error) ||
                !write_file(dir / PYTHON_RUNNER_FILE, PYTHON_RUNNER, error)) {
                return false;
            }
            args.push_back(PYTHON_RUNNER_FILE);
            return true;

        case Language::JAVASCRIPT:
            if (!write_file(dir / JAVASCRIPT_USER_FILE, code, error)) {
                return false;
            }
            args.push_back(JAVASCRIPT_USER_FILE);
            return true;
    }

    error = "unsupported language";
    return false;
}

std::vector<std::string> sandbox_environment(const fs::path& dir) {
    const std::string d = dir.string();
    return {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "PYTHONPATH=",
        "HOME=" + d,
        "TEMP=" + d,
        "TMP=" + d,
        "TMPDIR=" + d,
        "LANG=C.UTF-8",
        "PYTHONIOENCODING=utf-8",
        "PYTHONUTF8=1",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONUNBUFFERED=1",
        "MPLBACKEND=Agg",
        "MPLCONFIGDIR=" + d,
        // BLAS thread pools reserve address space per thread
        "OPENBLAS_NUM_THREADS=1",
        "OMP_NUM_THREADS=1",
    };
}

} // namespace execore::runtime
