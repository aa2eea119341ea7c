#include "sandbox/node_harness.hpp"

#include <string_view>

namespace codegrader {

namespace {

// Strict mode matters beyond style here: functions in the context cannot reach our frames through
// ``Function.prototype.caller`` when every caller on this side is strict.
constexpr std::string_view HARNESS = R"JS('use strict';
const vm = require('vm');

// Evaluated inside every fresh context before the submission (its source text is re-parsed there,
// so everything it creates belongs to the context realm). The built-ins it captures stay pristine
// whatever the submission does to the globals afterwards.
function prelude(global) {
  'use strict';
  const ReflectApply = Reflect.apply;
  const JSONParse = JSON.parse;
  const ObjectKeys = Object.keys;
  const ObjectFreeze = Object.freeze;
  const ObjectDefineProperty = Object.defineProperty;
  const PromiseCtor = Promise;
  const PromiseResolve = Promise.resolve;
  const PromiseThen = Promise.prototype.then;
  const StringTrim = String.prototype.trim;

  const noop = function () {};
  const console = ObjectFreeze({
    log: noop, info: noop, warn: noop, error: noop, debug: noop, trace: noop, dir: noop, table: noop,
  });
  const module = { exports: {} };

  const hidden = (value) => ({ value, writable: true, configurable: true, enumerable: false });
  ObjectDefineProperty(global, 'console', hidden(console));
  ObjectDefineProperty(global, 'module', hidden(module));
  ObjectDefineProperty(global, 'exports', hidden(module.exports));

  const isFunction = (value) => typeof value === 'function';

  function singleFunctionProperty(holder) {
    if (holder === null || typeof holder !== 'object') {
      return undefined;
    }
    const keys = ObjectKeys(holder);
    let found;
    let count = 0;
    for (let i = 0; i < keys.length; i++) {
      const value = holder[keys[i]];
      if (isFunction(value)) {
        found = value;
        count++;
      }
    }
    return count === 1 ? found : undefined;
  }

  let state = 'pending';
  let settledValue;

  return ObjectFreeze({
    exportedCallable() {
      const exported = module.exports;
      if (isFunction(exported)) {
        return exported;
      }
      const fromModule = singleFunctionProperty(exported);
      if (fromModule !== undefined) {
        return fromModule;
      }
      const globalExports = global.exports;
      return globalExports !== exported ? singleFunctionProperty(globalExports) : undefined;
    },

    isBlank(input) {
      return ReflectApply(StringTrim, input, []) === '';
    },

    // JSON first; null tells the caller to fall back to a JavaScript array literal
    parseArguments(input) {
      if (ReflectApply(StringTrim, input, []) === '') {
        return [];
      }
      try {
        return JSONParse('[' + input + ']');
      } catch (error) {
        return null;
      }
    },

    invoke(callable, args) {
      return ReflectApply(callable, undefined, args);
    },

    settle(value) {
      state = 'pending';
      settledValue = undefined;
      let then;
      if (value !== null && (typeof value === 'object' || typeof value === 'function')) {
        then = value.then;
      }
      if (!isFunction(then)) {
        state = 'fulfilled';
        settledValue = value;
        return;
      }
      const promise = ReflectApply(PromiseResolve, PromiseCtor, [value]);
      ReflectApply(PromiseThen, promise, [
        (result) => { state = 'fulfilled'; settledValue = result; },
        (reason) => { state = 'rejected'; settledValue = reason; },
      ]);
    },

    state() {
      return state;
    },

    settledValue() {
      return settledValue;
    },
  });
}

const IDENTIFIER = /^[A-Za-z_$][\w$]*$/;

function describeError(error) {
  try {
    return String(error);
  } catch (nested) {
    return 'Uncaught exception';
  }
}

function render(value) {
  if (typeof value === 'string') {
    return value;
  }
  if (value === undefined) {
    return 'undefined';
  }
  try {
    const json = JSON.stringify(value);
    if (typeof json === 'string') {
      return json;
    }
  } catch (error) {
    // fall through to String()
  }
  try {
    return String(value);
  } catch (error) {
    return '[unrenderable value]';
  }
}

function lookupDeclared(context, candidates) {
  for (let i = candidates.length - 1; i >= 0; i--) {
    const name = candidates[i];
    if (typeof name !== 'string' || !IDENTIFIER.test(name)) {
      continue;
    }
    let value;
    try {
      value = vm.runInContext(name, context, { filename: 'lookup.js' });
    } catch (error) {
      continue;
    }
    if (typeof value === 'function') {
      return value;
    }
  }
  return undefined;
}

const nextTick = () => new Promise((resolve) => setTimeout(resolve, 1));

async function grade(request) {
  let script;
  try {
    script = new vm.Script(request.code, { filename: 'submission.js' });
  } catch (error) {
    return { status: 'compile_error', message: describeError(error) };
  }

  if (request.mode === 'compile') {
    return { status: 'ok', value: '' };
  }

  const context = vm.createContext(Object.create(null), {
    name: 'submission',
    codeGeneration: { strings: true, wasm: false },
  });
  const driver = vm.runInContext('(' + prelude.toString() + ')(globalThis)', context, { filename: 'prelude.js' });
  const input = typeof request.input === 'string' ? request.input : '';
  const candidates = Array.isArray(request.candidates) ? request.candidates : [];

  try {
    const completion = script.runInContext(context);

    let callable = driver.exportedCallable();
    if (callable === undefined) {
      callable = lookupDeclared(context, candidates);
    }
    if (callable === undefined && typeof completion === 'function') {
      callable = completion;
    }

    let result;
    if (callable !== undefined) {
      let args = driver.parseArguments(input);
      if (args === null) {
        args = vm.runInContext('[' + input + '\n]', context, { filename: 'input.js' });
      }
      result = driver.invoke(callable, args);
    } else if (driver.isBlank(input)) {
      result = completion;
    } else {
      result = vm.runInContext(input, context, { filename: 'input.js' });
    }

    driver.settle(result);
  } catch (error) {
    return { status: 'runtime_error', message: describeError(error) };
  }

  while (driver.state() === 'pending') {
    await nextTick();
  }

  if (driver.state() === 'rejected') {
    return { status: 'runtime_error', message: describeError(driver.settledValue()) };
  }

  return { status: 'ok', value: render(driver.settledValue()) };
}

let replied = false;

function send(reply) {
  if (replied) {
    return;
  }
  replied = true;
  process.stdout.write(JSON.stringify(reply) + '\n', () => process.exit(0));
}

process.on('uncaughtException', (error) => {
  send({ status: 'runtime_error', message: describeError(error) });
});

const chunks = [];
process.stdin.on('data', (chunk) => chunks.push(chunk));
process.stdin.on('end', () => {
  let request;
  try {
    request = JSON.parse(Buffer.concat(chunks).toString('utf8'));
  } catch (error) {
    send({ status: 'harness_error', message: 'Malformed request: ' + describeError(error) });
    return;
  }
  grade(request).then(send, (error) => {
    send({ status: 'harness_error', message: describeError(error && error.stack ? error.stack : error) });
  });
});
)JS";

} // namespace

std::string_view node_harness_script() {
    return HARNESS;
}

} // namespace codegrader
