/**
 * @file python_bootstrap.cpp
 * @brief Source of the Python worker
 *
 * Launched as: python3 -I -B -c <script> <config-json>
 *
 * fd 0 and fd 1 are both the worker's end of a socketpair. The script keeps
 * private duplicates for the protocol and points fd 0/1 at /dev/null so
 * nothing else can write into the channel.
 *
 * Messages (one JSON object per line):
 *   in:  execute{id, code, timeoutMs}, validate{id, code},
 *        installDependencies{id, deps}, terminate{id}
 *   out: ready{id, loadedPackages, failedPackages, pythonVersion},
 *        result{...}, error{id, message}, progress{id, text},
 *        dependenciesInstalled{id, installed}
 */

#include "python_engine.hpp"

namespace liverun {

const char* PythonEngine::bootstrap_script() {
    return R"PYTHON(
import sys


def main():
    import base64
    import builtins
    import ctypes
    import html
    import importlib
    import io
    import json
    import linecache
    import os
    import platform
    import re
    import resource
    import threading
    import time
    import traceback
    import types

    config = json.loads(sys.argv[1])
    policy = config['policy']
    blocked_modules = set(policy.get('blocked_modules', []))
    blocked_builtins = set(policy.get('blocked_builtins', []))
    max_capture = int(config.get('maxCaptureBytes', 1048576))
    user_file = '<user_code>'
    package_aliases = {
        'scikit-learn': 'sklearn', 'pillow': 'PIL', 'beautifulsoup4': 'bs4',
        'opencv-python': 'cv2', 'pyyaml': 'yaml', 'python-dateutil': 'dateutil',
    }

    proto_in = os.fdopen(os.dup(0), 'r', encoding='utf-8', newline='\n')
    proto_out = os.fdopen(os.dup(0), 'w', encoding='utf-8', newline='\n')
    null_fd = os.open(os.devnull, os.O_RDWR)
    os.dup2(null_fd, 0)
    os.dup2(null_fd, 1)
    os.close(null_fd)
    sys.stdin = io.StringIO('')
    sys.stdout = io.StringIO()

    def clean(text):
        if not isinstance(text, str):
            text = str(text)
        return text.encode('utf-8', 'replace').decode('utf-8')

    def send(message):
        proto_out.write(json.dumps(message) + '\n')
        proto_out.flush()

    if sys.version_info < (3, 8):
        send({'type': 'error', 'id': 'bootstrap',
              'message': 'Python 3.8 or newer is required, found ' + platform.python_version()})
        return 1

    def module_violation(name):
        return "Module '%s' is not allowed for security reasons" % name

    def function_violation(name):
        return "Function '%s' is not allowed for security reasons" % name

    def module_blocked(name):
        return name in blocked_modules or name.split('.', 1)[0] in blocked_modules

    # ------------------------------------------------------------------
    # Timeouts
    # ------------------------------------------------------------------

    class ExecutionTimeout(BaseException):
        pass

    # Resolved before the audit hook is installed, which denies ctypes.dlsym
    set_async_exc = ctypes.pythonapi.PyThreadState_SetAsyncExc
    stop_grace_s = 0.25

    # ------------------------------------------------------------------
    # Default packages
    # ------------------------------------------------------------------

    loaded = []
    failed = {}
    for package in config.get('defaultPackages', []):
        try:
            importlib.import_module(package)
            loaded.append(package)
        except Exception as exc:
            failed[package] = '%s: %s' % (type(exc).__name__, exc)

    if 'matplotlib' in loaded:
        import matplotlib
        matplotlib.use('Agg')
        import matplotlib.pyplot as plt
        plt.show = lambda *args, **kwargs: None

    # ------------------------------------------------------------------
    # Audit hook
    # ------------------------------------------------------------------

    read_roots = set()
    for root in list(sys.path) + [sys.prefix, sys.base_prefix, sys.exec_prefix,
                                  os.environ.get('MPLCONFIGDIR', ''),
                                  '/usr/share/fonts', '/usr/share/zoneinfo']:
        if root:
            read_roots.add(os.path.realpath(root))

    blocked_events = frozenset((
        'os.system', 'os.fork', 'os.forkpty', 'os.kill', 'os.killpg',
        'subprocess.Popen', 'pty.spawn',
        'socket.__new__', 'socket.connect', 'socket.bind', 'socket.sendto', 'socket.getaddrinfo',
        'os.remove', 'os.rename', 'os.rmdir', 'os.mkdir', 'os.chmod', 'os.chown',
        'os.link', 'os.symlink', 'os.truncate', 'os.utime', 'os.chdir',
        'os.putenv', 'os.unsetenv',
        'shutil.rmtree', 'shutil.copyfile', 'shutil.move', 'shutil.chown', 'shutil.make_archive',
        'ctypes.dlopen', 'ctypes.dlsym', 'ctypes.cdata', 'ctypes.addressof',
        'ctypes.string_at', 'ctypes.wstring_at',
        'code.__new__', 'mmap.__new__', 'resource.setrlimit', 'resource.prlimit',
        'urllib.Request', 'http.client.connect', 'ftplib.connect', 'smtplib.connect',
        'webbrowser.open',
        'sys._current_frames', 'sys.settrace', 'sys.setprofile',
        'gc.get_objects', 'gc.get_referrers', 'gc.get_referents',
        'signal.pthread_kill',
    ))

    def install_audit_hook(blocked_events, blocked_prefixes, protected_attributes, read_roots,
                           write_flags, separator, realpath, fsdecode, isinstance=isinstance,
                           str=str, int=int, PermissionError=PermissionError):
        # The hook has no switch. Its state is immutable and captured here, and
        # only the interpreter holds a reference to it.

        def deny(what):
            raise PermissionError("%s is not allowed for security reasons" % what)

        def check_read(path):
            if path is None:
                path = '.'
            if isinstance(path, int):
                return
            real = realpath(fsdecode(path))
            for root in read_roots:
                if real == root or real.startswith(root + separator):
                    return
            deny("Access to '%s'" % (path,))

        def check_open(args):
            path, mode, flags = args[0], args[1], args[2]
            writing = False
            if isinstance(mode, str):
                for c in 'wax+':
                    if c in mode:
                        writing = True
            if isinstance(flags, int) and flags & write_flags:
                writing = True
            if writing:
                deny("Writing to '%s'" % (path,))
            check_read(path)

        def audit(event, args):
            if event == 'open':
                check_open(args)
            elif event == 'os.listdir' or event == 'os.scandir':
                check_read(args[0])
            elif event == 'object.__setattr__' or event == 'object.__delattr__':
                if args[1] in protected_attributes:
                    deny("Changing '%s'" % args[1])
            elif event in blocked_events or event.startswith(blocked_prefixes):
                deny("Operation '%s'" % event)

        sys.addaudithook(audit)

    install_audit_hook(
        blocked_events,
        ('os.exec', 'os.spawn', 'os.posix_spawn'),
        frozenset(('__code__',)),
        frozenset(read_roots),
        os.O_WRONLY | os.O_RDWR | os.O_CREAT | os.O_APPEND | os.O_TRUNC,
        os.sep,
        os.path.realpath,
        os.fsdecode,
    )

    # ------------------------------------------------------------------
    # Restricted builtins, rebuilt for every run
    # ------------------------------------------------------------------

    real_import = builtins.__import__
    pristine_builtins = dict(builtins.__dict__)

    def blocked_function(name):
        def blocked(*args, **kwargs):
            raise RuntimeError(function_violation(name))
        blocked.__name__ = name
        return blocked

    def make_builtins():
        def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
            # The import statement always passes the importing module's globals
            if '__import__' in blocked_builtins and globals is None:
                raise RuntimeError(function_violation('__import__'))
            if level == 0 and module_blocked(name):
                raise ImportError(module_violation(name))
            module = real_import(name, globals, locals, fromlist, level)
            for item in fromlist or ():
                value = getattr(module, item, None)
                if isinstance(value, types.ModuleType) and module_blocked(value.__name__):
                    raise ImportError(module_violation(value.__name__))
            return module

        safe = dict(pristine_builtins)
        for name in blocked_builtins:
            safe[name] = blocked_function(name)
        safe['__import__'] = guarded_import
        return safe

    # User code runs on its own thread through a runner compiled into an empty
    # namespace, so no frame reachable from it belongs to the worker.
    runner_source = (
        'def run_user_code(code, namespace, outcome):\n'
        '    try:\n'
        '        exec(code, namespace)\n'
        '    except BaseException as exc:\n'
        '        outcome.append(exc)\n'
    )

    def make_runner():
        namespace = {'__builtins__': {'exec': exec, 'BaseException': BaseException}}
        exec(compile(runner_source, '<runner>', 'exec'), namespace)
        return namespace['run_user_code']

    # ------------------------------------------------------------------
    # Per-call execution
    # ------------------------------------------------------------------

    class Capture(io.StringIO):
        def __init__(self, limit):
            super().__init__()
            self.limit = limit
            self.size = 0
            self.truncated = False

        def write(self, text):
            if not isinstance(text, str):
                raise TypeError('write() argument must be str, not %s' % type(text).__name__)
            room = self.limit - self.size
            chunk = text[:max(room, 0)]
            if len(chunk) < len(text):
                self.truncated = True
            if chunk:
                self.size += len(chunk)
                super().write(chunk)
            return len(text)

    def format_error(exc):
        report = traceback.TracebackException(type(exc), exc, exc.__traceback__)
        report.stack = traceback.StackSummary.from_list(
            [frame for frame in report.stack if frame.filename == user_file])
        report.__cause__ = None
        report.__context__ = None
        return ''.join(report.format()).rstrip('\n')

    def capture_figures(stderr):
        artifacts = []
        pyplot = sys.modules.get('matplotlib.pyplot')
        if pyplot is None:
            return artifacts
        try:
            for number in pyplot.get_fignums():
                figure = pyplot.figure(number)
                buffer = io.BytesIO()
                try:
                    figure.savefig(buffer, format='png', bbox_inches='tight', dpi=100)
                except Exception as exc:
                    stderr.write('Could not render figure %d: %s\n' % (number, exc))
                    continue
                artifacts.append({
                    'kind': 'image',
                    'mimeType': 'image/png',
                    'data': 'data:image/png;base64,' + base64.b64encode(buffer.getvalue()).decode('ascii'),
                })
        finally:
            pyplot.close('all')
        return artifacts

    def capture_dataframes(user_globals, stderr):
        artifacts = []
        pandas = sys.modules.get('pandas')
        if pandas is None:
            return artifacts
        for name, value in list(user_globals.items()):
            if name.startswith('_') or not isinstance(value, pandas.DataFrame):
                continue
            try:
                table = value.to_html(max_rows=100, max_cols=20, classes='dataframe')
            except Exception as exc:
                stderr.write('Could not render DataFrame %s: %s\n' % (name, exc))
                continue
            artifacts.append({
                'kind': 'table',
                'mimeType': 'text/html',
                'data': '<h4>DataFrame: %s</h4>%s' % (html.escape(name), table),
            })
        return artifacts

    def run(request_id, code, timeout_ms):
        started = time.perf_counter()
        stdout = Capture(max_capture)
        stderr = Capture(max_capture)
        user_globals = {'__builtins__': make_builtins(), '__name__': '__main__'}
        error = None
        linecache.cache[user_file] = (len(code), None, code.splitlines(True), user_file)

        try:
            compiled = compile(code, user_file, 'exec')
        except SyntaxError as exc:
            compiled = None
            error = format_error(exc)

        if compiled is not None:
            outcome = []
            saved = sys.stdout, sys.stderr
            sys.stdout, sys.stderr = stdout, stderr
            try:
                runner = threading.Thread(target=make_runner(), args=(compiled, user_globals, outcome),
                                          name='liverun-user-code', daemon=True)
                runner.start()
                runner.join(timeout_ms / 1000.0 if timeout_ms > 0 else None)
                timed_out = runner.is_alive()
                if timed_out:
                    set_async_exc(ctypes.c_ulong(runner.ident), ctypes.py_object(ExecutionTimeout))
                    runner.join(stop_grace_s)
                    if runner.is_alive():
                        # Blocked in native code; the host watchdog replaces this worker
                        runner.join()
            finally:
                sys.stdout, sys.stderr = saved
            if timed_out:
                error = 'TimeoutError: Execution timed out after %dms' % timeout_ms
            elif outcome:
                error = format_error(outcome[0])

        artifacts = capture_figures(stderr)
        has_plots = bool(artifacts)
        tables = capture_dataframes(user_globals, stderr)
        artifacts.extend(tables)
        user_globals.clear()
        linecache.cache.pop(user_file, None)

        send({
            'type': 'result',
            'id': request_id,
            'success': error is None,
            'output': clean(stdout.getvalue()),
            'error': clean(error or ''),
            'artifacts': artifacts,
            'durationMs': (time.perf_counter() - started) * 1000.0,
            'memoryBytes': resource.getrusage(resource.RUSAGE_SELF).ru_maxrss * 1024,
            'metadata': {
                'loadedPackages': sorted(loaded),
                'hasPlots': has_plots,
                'hasDataFrames': bool(tables),
                'pythonVersion': platform.python_version(),
                'outputTruncated': stdout.truncated,
                'stderr': clean(stderr.getvalue()),
            },
        })

    def validate(request_id, code):
        try:
            compile(code, user_file, 'exec')
            send({'type': 'result', 'id': request_id, 'success': True, 'output': ''})
        except SyntaxError as exc:
            send({'type': 'result', 'id': request_id, 'success': False,
                  'error': clean(format_error(exc))})

    def install(request_id, dependencies):
        installed = []
        for dependency in dependencies:
            package = re.split(r'[<>=!~\[;\s]', str(dependency).strip(), 1)[0]
            if not package:
                continue
            module_name = package_aliases.get(package.lower(), package)
            if module_blocked(module_name):
                send({'type': 'error', 'id': request_id, 'message': module_violation(module_name)})
                return
            send({'type': 'progress', 'id': request_id, 'text': 'Loading %s' % package})
            try:
                importlib.import_module(module_name)
            except Exception as exc:
                send({'type': 'error', 'id': request_id,
                      'message': "Package '%s' is not available: %s" % (package, clean(exc))})
                return
            if package not in loaded:
                loaded.append(package)
            installed.append(package)
        send({'type': 'dependenciesInstalled', 'id': request_id, 'installed': installed})

    send({
        'type': 'ready',
        'id': 'bootstrap',
        'loadedPackages': loaded,
        'failedPackages': failed,
        'pythonVersion': platform.python_version(),
    })

    for line in proto_in:
        line = line.strip()
        if not line:
            continue
        try:
            message = json.loads(line)
        except ValueError:
            send({'type': 'error', 'id': '', 'message': 'Malformed command line'})
            continue

        kind = message.get('type')
        request_id = str(message.get('id', ''))
        if kind == 'terminate':
            break
        try:
            if kind == 'execute':
                run(request_id, str(message.get('code', '')), int(message.get('timeoutMs', 0)))
            elif kind == 'validate':
                validate(request_id, str(message.get('code', '')))
            elif kind == 'installDependencies':
                install(request_id, list(message.get('deps', [])))
            else:
                send({'type': 'error', 'id': request_id, 'message': 'Unknown command %r' % kind})
        except Exception as exc:
            send({'type': 'error', 'id': request_id, 'message': 'Worker error: %s' % clean(exc)})
    return 0


sys.exit(main())
)PYTHON";
}

} // namespace liverun
