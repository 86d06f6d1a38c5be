/*
 * bridge_page_template.hpp - WebHID capture page served to the browser
 *
 * Placeholders __WS_PORT__, __VID__ and __PID__ are substituted by
 * renderBridgePage() before the page is served.
 *
 * Every input report is forwarded as one binary WebSocket message:
 *   [0x03][0x00][reportId][report data...]
 */

#ifndef BRIDGE_PAGE_TEMPLATE_HPP
#define BRIDGE_PAGE_TEMPLATE_HPP

namespace bridge {

// clang-format off
static const char BRIDGE_PAGE_TEMPLATE[] = R"rawliteral(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<title>kbhall bridge</title>
<style>
body{font-family:system-ui,sans-serif;background:#171717;color:#ddd;max-width:560px;margin:40px auto;padding:0 16px}
h1{font-size:1.2em;color:#39b3ff}
button{background:#39b3ff;color:#111;border:none;border-radius:4px;padding:10px 18px;font-size:1em;cursor:pointer}
button:disabled{background:#444;color:#888;cursor:default}
#log{font-family:monospace;font-size:.8em;color:#888;margin-top:16px;white-space:pre-wrap}
.ok{color:#4ecc6a}.warn{color:#e6b34d}
</style>
</head>
<body>
<h1>Analog keyboard bridge</h1>
<p>Device <code>__VID__:__PID__</code>, relay port <code>__WS_PORT__</code></p>
<p id="state" class="warn">Relay disconnected</p>
<button id="connect">Connect</button>
<div id="log"></div>
<script>
const WS_URL = "ws://127.0.0.1:__WS_PORT__";
const FILTER = { vendorId: __VID__, productId: __PID__ };
const MSG_ANALOG = 0x03;

let ws = null;
let device = null;

function log(msg) {
  const el = document.getElementById("log");
  el.textContent = (msg + "\n" + el.textContent).slice(0, 4000);
}

function setState(text, ok) {
  const el = document.getElementById("state");
  el.textContent = text;
  el.className = ok ? "ok" : "warn";
}

function openRelay() {
  ws = new WebSocket(WS_URL);
  ws.binaryType = "arraybuffer";
  ws.onopen = () => setState(device ? "Streaming" : "Relay connected - click Connect", true);
  ws.onclose = () => {
    setState("Relay disconnected - retrying", false);
    setTimeout(openRelay, 1000);
  };
  ws.onerror = () => ws.close();
}

function forward(event) {
  if (!ws || ws.readyState !== WebSocket.OPEN) {
    return;
  }
  const data = new Uint8Array(event.data.buffer, event.data.byteOffset, event.data.byteLength);
  const frame = new Uint8Array(3 + data.length);
  frame[0] = MSG_ANALOG;
  frame[1] = 0x00;
  frame[2] = event.reportId;
  frame.set(data, 3);
  ws.send(frame);
}

async function connectDevice() {
  if (!("hid" in navigator)) {
    log("WebHID is not available in this browser");
    return;
  }
  const devices = await navigator.hid.requestDevice({ filters: [FILTER] });
  if (devices.length === 0) {
    log("No device selected");
    return;
  }
  for (const d of devices) {
    if (!d.opened) {
      await d.open();
    }
    d.addEventListener("inputreport", forward);
    log("Opened " + d.productName);
  }
  device = devices[0];
  document.getElementById("connect").disabled = true;
  setState("Streaming", true);
}

navigator.hid && navigator.hid.addEventListener("disconnect", (e) => {
  if (e.device === device) {
    device = null;
    document.getElementById("connect").disabled = false;
    setState("Device disconnected", false);
    if (ws) {
      ws.close();
    }
  }
});

document.getElementById("connect").addEventListener("click", () => {
  connectDevice().catch((e) => log("Connect failed: " + e));
});

openRelay();
</script>
</body>
</html>
)rawliteral";
// clang-format on

} // namespace bridge

#endif // BRIDGE_PAGE_TEMPLATE_HPP
