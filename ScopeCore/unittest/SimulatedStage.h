// A simulated exhibit stage for ScopeCore unit tests. Step pulses move the
// simulated axes; the optical sensors and limit switches are functions of
// the simulated positions. Tests can hold buttons, force inputs, make writes
// to a pin fail, and count writes per pin.

#pragma once

#include "ScopeDevice.h"
#include "StageConfig.h"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>

struct SimulatedStage : SC::PinPort {
   std::string name = "SimulatedStage";

   // Sensor models, evaluated against the physical position of the axis
   std::function<bool(long)> optical1At;
   std::function<bool(long)> optical2At;
   std::function<bool(long)> zoomLimitAt;
   std::function<bool(long)> focusLimitAt;

   int initializeResult = DEVICE_OK;

   explicit SimulatedStage(const scope::StageConfig& config) :
      config_(config)
   {}

   int Initialize() override { return initializeResult; }
   int Shutdown() override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++shutdownCount_;
      return DEVICE_OK;
   }
   void GetName(char* buf) const override {
      CDeviceUtils::CopyLimitedString(buf, name.c_str());
   }

   int SetupOutput(int pin, SC::PinLevel initial) override {
      std::lock_guard<std::mutex> lock(mutex_);
      outputs_[pin] = initial;
      return DEVICE_OK;
   }

   int SetupInput(int pin, SC::PinPull pull) override {
      std::lock_guard<std::mutex> lock(mutex_);
      pulls_[pin] = pull;
      return DEVICE_OK;
   }

   SC::PinLevel ReadPin(int pin) override {
      std::lock_guard<std::mutex> lock(mutex_);
      auto forced = forcedInputs_.find(pin);
      if (forced != forcedInputs_.end())
         return forced->second;

      if (IsButtonPin(pin))
         return heldButtons_.count(pin) ? SC::PinLow : SC::PinHigh;
      if (pin == config_.optical1Pin)
         return Evaluate(optical1At, position_[scope::AxisTray]);
      if (pin == config_.optical2Pin)
         return Evaluate(optical2At, position_[scope::AxisTray]);
      if (pin == config_.limitZoomPin)
         return Evaluate(zoomLimitAt, position_[scope::AxisZoom]);
      if (pin == config_.limitFocusPin)
         return Evaluate(focusLimitAt, position_[scope::AxisFocus]);
      return SC::PinLow;
   }

   int WritePin(int pin, SC::PinLevel level) override {
      std::lock_guard<std::mutex> lock(mutex_);
      ++writes_[pin];
      if (failingPins_.count(pin))
         return DEVICE_PIN_WRITE_FAILED;

      const SC::PinLevel previous = outputs_[pin];
      outputs_[pin] = level;

      const scope::AxisId axes[] = { scope::AxisTray, scope::AxisZoom, scope::AxisFocus };
      for (scope::AxisId axis : axes) {
         const scope::AxisPins& p = config_.PinsFor(axis);
         if (pin == p.stepPin && previous == SC::PinLow && level == SC::PinHigh) {
            position_[axis] += (outputs_[p.dirPin] == SC::PinHigh) ? 1 : -1;
            ++stepEdges_[axis];
         }
      }
      return DEVICE_OK;
   }

   // Test controls

   void HoldButton(int pin, bool held) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (held)
         heldButtons_.insert(pin);
      else
         heldButtons_.erase(pin);
   }

   void ForceInput(int pin, SC::PinLevel level) {
      std::lock_guard<std::mutex> lock(mutex_);
      forcedInputs_[pin] = level;
   }

   void ReleaseInput(int pin) {
      std::lock_guard<std::mutex> lock(mutex_);
      forcedInputs_.erase(pin);
   }

   void FailWritesTo(int pin) {
      std::lock_guard<std::mutex> lock(mutex_);
      failingPins_.insert(pin);
   }

   void SetPosition(scope::AxisId axis, long position) {
      std::lock_guard<std::mutex> lock(mutex_);
      position_[axis] = position;
   }

   long Position(scope::AxisId axis) const {
      std::lock_guard<std::mutex> lock(mutex_);
      return position_[axis];
   }

   long StepEdges(scope::AxisId axis) const {
      std::lock_guard<std::mutex> lock(mutex_);
      return stepEdges_[axis];
   }

   long Writes(int pin) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = writes_.find(pin);
      return it == writes_.end() ? 0 : it->second;
   }

   long WritesToAxis(scope::AxisId axis) const {
      const scope::AxisPins& p = config_.PinsFor(axis);
      return Writes(p.stepPin) + Writes(p.dirPin);
   }

   SC::PinLevel OutputLevel(int pin) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = outputs_.find(pin);
      return it == outputs_.end() ? SC::PinLow : it->second;
   }

   bool IsConfiguredOutput(int pin) const {
      std::lock_guard<std::mutex> lock(mutex_);
      return outputs_.count(pin) != 0;
   }

   bool GetPull(int pin, SC::PinPull& pull) const {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pulls_.find(pin);
      if (it == pulls_.end())
         return false;
      pull = it->second;
      return true;
   }

   int ShutdownCount() const {
      std::lock_guard<std::mutex> lock(mutex_);
      return shutdownCount_;
   }

private:
   static SC::PinLevel Evaluate(const std::function<bool(long)>& f, long position) {
      return (f && f(position)) ? SC::PinHigh : SC::PinLow;
   }

   bool IsButtonPin(int pin) const {
      const scope::AxisId axes[] = { scope::AxisTray, scope::AxisZoom, scope::AxisFocus };
      for (scope::AxisId axis : axes) {
         const scope::AxisPins& p = config_.PinsFor(axis);
         if (pin == p.cwButtonPin || pin == p.ccwButtonPin)
            return true;
      }
      return false;
   }

   const scope::StageConfig config_;
   mutable std::mutex mutex_;
   std::map<int, SC::PinLevel> outputs_;
   std::map<int, SC::PinPull> pulls_;
   std::map<int, SC::PinLevel> forcedInputs_;
   std::map<int, long> writes_;
   std::set<int> failingPins_;
   std::set<int> heldButtons_;
   long position_[scope::NumAxes] = { 0, 0, 0 };
   long stepEdges_[scope::NumAxes] = { 0, 0, 0 };
   int shutdownCount_ = 0;
};
