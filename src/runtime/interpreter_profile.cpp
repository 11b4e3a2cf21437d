#include "runtime/interpreter_profile.hpp"

namespace simlab::runtime {

namespace {

constexpr const char* kPythonSnippetRunner = R"PY(import os
import sys
import textwrap
import traceback

_code_file = os.environ["SIMLAB_CODE_FILE"]
_dataset_file = os.environ.get("SIMLAB_DATASET", "")
_artifact_dir = os.environ["SIMLAB_ARTIFACT_DIR"]


def _load_dataset(path):
    if not path:
        return None
    try:
        import pandas
        return pandas.read_csv(path)
    except Exception:
        import csv
        with open(path, newline="") as fh:
            return list(csv.DictReader(fh))


_namespace = {"__name__": "__snippet__", "ARTIFACT_DIR": _artifact_dir}

try:
    import matplotlib
    matplotlib.use("Agg")
    import matplotlib.pyplot as plt

    _plots = [0]

    def _save_show(*args, **kwargs):
        _plots[0] += 1
        name = os.path.join(_artifact_dir, "plot_%d.png" % _plots[0])
        plt.savefig(name, bbox_inches="tight")
        plt.close()
        return name

    plt.show = _save_show
    _namespace["plt"] = plt
except Exception:
    pass

for _alias, _module in (("np", "numpy"), ("pd", "pandas")):
    try:
        _namespace[_alias] = __import__(_module)
    except Exception:
        pass

try:
    _namespace["df"] = _load_dataset(_dataset_file)
    with open(_code_file) as fh:
        _source = textwrap.dedent(fh.read())
    exec(compile(_source, "<snippet>", "exec"), _namespace)
except SystemExit:
    raise
except BaseException:
    traceback.print_exc()
    sys.exit(1)
)PY";

constexpr const char* kPythonEntryPointRunner = R"PY(import importlib.util
import json
import os
import sys
import traceback


def _plain(value):
    if hasattr(value, "tolist"):
        return value.tolist()
    if hasattr(value, "item"):
        return value.item()
    raise TypeError("value of type %s is not JSON serializable" % type(value).__name__)


try:
    _spec = importlib.util.spec_from_file_location("candidate", os.environ["SIMLAB_CODE_FILE"])
    _module = importlib.util.module_from_spec(_spec)
    _spec.loader.exec_module(_module)
    _entry = getattr(_module, os.environ["SIMLAB_ENTRY_POINT"])
    with open(os.environ["SIMLAB_PARAMS_FILE"]) as fh:
        _params = json.load(fh)
    _result = _entry(**_params)
except SystemExit:
    raise
except BaseException:
    traceback.print_exc()
    sys.exit(1)

try:
    _payload = json.dumps(_result, default=_plain, allow_nan=False)
except (TypeError, ValueError) as exc:
    sys.stderr.write("return value is not JSON serializable: %s\n" % exc)
    sys.exit(3)

with open(os.environ["SIMLAB_RESULT_FILE"], "w") as fh:
    fh.write(_payload)
)PY";

constexpr const char* kShellSnippetRunner =
    "cd \"$SIMLAB_ARTIFACT_DIR\" || exit 126\n"
    ". \"$SIMLAB_CODE_FILE\"\n";

constexpr const char* kShellEntryPointRunner =
    "cd \"$SIMLAB_ARTIFACT_DIR\" || exit 126\n"
    ". \"$SIMLAB_CODE_FILE\"\n"
    "\"$SIMLAB_ENTRY_POINT\" > \"$SIMLAB_RESULT_FILE\"\n";

}  // namespace

InterpreterProfile python_profile(const std::string& interpreter) {
    InterpreterProfile profile;
    profile.name = "python";
    profile.command = {interpreter, "-B"};
    profile.script_extension = ".py";
    profile.snippet_runner = kPythonSnippetRunner;
    profile.entry_point_runner = kPythonEntryPointRunner;
    return profile;
}

InterpreterProfile shell_profile() {
    InterpreterProfile profile;
    profile.name = "sh";
    profile.command = {"/bin/sh"};
    profile.script_extension = ".sh";
    profile.snippet_runner = kShellSnippetRunner;
    profile.entry_point_runner = kShellEntryPointRunner;
    return profile;
}

}  // namespace simlab::runtime
