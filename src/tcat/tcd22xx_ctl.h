/*
 * Copyright (C) 2005-2009 by Pieter Palmers
 *
 * This file is part of FFADO
 * FFADO = Free Firewire (pro-)audio drivers for linux
 *
 * FFADO is based upon FreeBoB
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 2 of the License, or
 * (at your option) version 3 of the License.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef TCAT_TCD22XX_CTL_H
#define TCAT_TCD22XX_CTL_H

#include "debugmodule/debugmodule.h"

#include "tcat_device.h"
#include "tcat_eap.h"
#include "tcat_clock.h"
#include "tcat_error.h"
#include "tcd22xx_spec.h"
#include "tcd22xx_router.h"
#include "tcd22xx_mixer.h"

#include "libcontrol/ElementRegistry.h"

#include <string>
#include <vector>

#define TCAT_ELEM_CLOCK_RATE                    "clock-rate"
#define TCAT_ELEM_CLOCK_SOURCE                  "clock-source"
#define TCAT_ELEM_LOCKED_CLOCK_SOURCE           "locked-clock-source"
#define TCAT_ELEM_SLIPPED_CLOCK_SOURCE          "slipped-clock-source"

#define TCAT_ELEM_ROUTER_OUT_SRC                "output-source"
#define TCAT_ELEM_ROUTER_STREAM_SRC             "stream-source"
#define TCAT_ELEM_ROUTER_MIXER_SRC              "mixer-source"

#define TCAT_ELEM_MIXER_SRC_GAIN                "mixer-source-gain"

#define TCAT_ELEM_OUT_METER                     "output-source-meter"
#define TCAT_ELEM_STREAM_METER                  "stream-source-meter"
#define TCAT_ELEM_MIXER_METER                   "mixer-source-meter"
#define TCAT_ELEM_MIXER_SATURATION              "mixer-out-saturation"

#define TCAT_ELEM_STANDALONE_CLOCK_SOURCE       "standalone-clock-source"
#define TCAT_ELEM_STANDALONE_SPDIF_HIGH_RATE    "standalone-spdif-high-rate"
#define TCAT_ELEM_STANDALONE_ADAT_MODE          "standalone-adat-mode"
#define TCAT_ELEM_STANDALONE_WC_MODE            "standalone-word-clock-mode"
#define TCAT_ELEM_STANDALONE_WC_NUMERATOR       "standalone-word-clock-rate-numerator"
#define TCAT_ELEM_STANDALONE_WC_DENOMINATOR     "standalone-word-clock-rate-denominator"
#define TCAT_ELEM_STANDALONE_INTERNAL_RATE      "standalone-internal-clock-rate"

// upper 12 bits of a sample
#define TCAT_METER_MAX                          0x0fff

namespace Tcat {

/**
 * @brief Control elements of a TCD22xx unit
 *
 * Ties the clock, router, mixer and standalone engines to an element
 * registry. Elements whose state the device may change on its own are
 * listed as notified, meters as measured.
 */
class Tcd22xxController
{
public:
    Tcd22xxController( Device& device, const DeviceProfile& profile );
    virtual ~Tcd22xxController();

    /// read the extension section table and capabilities
    bool init();

    Device& getDevice()
        { return m_device; };
    EAP& getEAP()
        { return m_eap; };
    const DeviceProfile& getProfile() const
        { return m_profile; };
    ClockEngine& getClock()
        { return m_clock; };
    StandaloneEngine& getStandalone()
        { return m_standalone; };
    RouterEngine& getRouter()
        { return m_router; };
    MixerEngine& getMixer()
        { return m_mixer; };

    /// read everything the elements reflect
    enum eStatus cacheWholeParams();
    /// read the meters
    enum eStatus cachePartialParams();

    /// add the elements to the registry, which must outlive this object
    bool load( Control::ElementRegistry& registry );
    const Control::ElementIdVector& getNotifiedElements() const
        { return m_notified; };
    const Control::ElementIdVector& getMeasuredElements() const
        { return m_measured; };

    /**
     * @brief current value of an element
     * @return false if the element is not known here
     */
    bool read( const Control::ElementId& id, Control::ElementValue& value );
    /**
     * @brief change an element
     * @param status the outcome, eS_InvalidArgument if nothing was sent
     * @return false if the element is not known here
     */
    bool write( const Control::ElementId& id, const Control::ElementValue& value,
                enum eStatus& status );

    /**
     * @brief react to the notification quadlet of the unit
     *
     * A change of the operating rate invalidates the available blocks, so
     * the router and mixer are read again and their elements rebuilt.
     */
    enum eStatus parseNotification( fb_quadlet_t msg );

    /// store the current configuration to flash
    enum eStatus storeConfiguration();
    /// restore the configuration from flash and read it back
    enum eStatus loadConfiguration();

    /// write router entries and mixer coefficients to an XML file
    bool saveState( const std::string& filename );
    enum eStatus restoreState( const std::string& filename );

    void show();
    void setVerboseLevel( int l );

private:
    bool loadClockElements();
    bool loadStandaloneElements();
    bool loadRouterElements();
    bool loadMixerElements();
    bool loadMeterElements();
    bool reloadRateDependentElements();
    void forgetElements( const char* name );

    enum eStatus cacheMeters();
    enum eStatus handleRateChange();

    bool readStandalone( const Control::ElementId& id, Control::ElementValue& value );
    bool writeStandalone( const Control::ElementId& id, const Control::ElementValue& value,
                          enum eStatus& status );
    bool readRouter( const Control::ElementId& id, Control::ElementValue& value );
    bool writeRouter( const Control::ElementId& id, const Control::ElementValue& value,
                      enum eStatus& status );
    bool readMeters( const Control::ElementId& id, Control::ElementValue& value );

    bool isSourceSupported( enum eClockSource src ) const;

    Device& m_device;
    const DeviceProfile& m_profile;
    EAP m_eap;
    ClockEngine m_clock;
    StandaloneEngine m_standalone;
    RouterEngine m_router;
    MixerEngine m_mixer;

    Control::ElementRegistry* m_registry;
    Control::ElementIdVector m_notified;
    Control::ElementIdVector m_measured;

    unsigned int m_current_rate;

    std::vector<int32_t> m_real_meter;
    std::vector<int32_t> m_stream_meter;
    std::vector<int32_t> m_mixer_meter;
    std::vector<bool> m_saturation;

protected:
    DECLARE_DEBUG_MODULE;
};

} // namespace Tcat

#endif // TCAT_TCD22XX_CTL_H
