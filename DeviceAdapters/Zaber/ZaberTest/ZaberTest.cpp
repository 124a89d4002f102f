#include "../ChainConfiguration.h"
#include "../ChainRegistry.h"

#include "../../../ZCCore/CoreUtils.h"
#include "../../../ZCCore/Error.h"
#include "../../../ZCCore/LogManager.h"

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace std;

int main(int argc, char* argv[])
{
   // Get configuration file name
   if (argc < 2)
   {
      cout << "Error. Configuration file not specified!" << endl;
      cout << "ZaberTest <config_file>" << endl;
      return 1;
   }
   else if (argc > 2)
   {
      cout << "Error. Too many parameters!" << endl;
      cout << "ZaberTest <config_file>" << endl;
      return 1;
   }
   string configFile(argv[1]);

   zc::LogManager logManager;
   logManager.SetUseStdErr(true);
   logManager.SetPrimaryLogLevel(zc::logging::LogLevelDebug);
   try
   {
      // Build the chain
      // ---------------

      cout << "Loading " << configFile << "..." << endl;
      ChainConfiguration config = ChainConfiguration::LoadFromFile(configFile);
      cout << "Done." << endl;

      cout << "Opening " << config.GetPort() << "..." << endl;
      unique_ptr<ChainRegistry> chain = ChainRegistry::Build(config, logManager);
      cout << "Done." << endl;

      // Enable and report each device
      // -----------------------------
      vector<long> addresses(chain->GetAddresses());
      for (unsigned i = 0; i < addresses.size(); i++)
      {
         ZC::Device& device = chain->GetDevice(addresses[i]);
         cout << "Device " << addresses[i] << " (" << ToString(device.GetKind()) << ")" << endl;

         if (device.GetKind() == ZC::StageKind)
         {
            ZC::Stage& stage = chain->GetStage(addresses[i]);
            cout << "Enabling..." << endl;
            stage.Enable();

            map<string, double> position(stage.GetPosition());
            map<string, ZC::AxisLimits> limits(stage.GetLimits());
            for (map<string, double>::const_iterator it = position.begin(); it != position.end(); ++it)
            {
               cout << "   axis " << it->first << " = " << it->second
                    << " [" << limits[it->first].lower << ", " << limits[it->first].upper << "]" << endl;
            }
         }
         else if (device.GetKind() == ZC::FilterWheelKind)
         {
            ZC::FilterWheel& wheel = chain->GetFilterWheel(addresses[i]);
            cout << "   position " << wheel.GetPosition() << " of "
                 << wheel.GetNumberOfPositions() << endl;
         }
      }
   }
   catch (CZCError& err)
   {
      cout << err.getFullMsg() << endl;
      return 1;
   }

   // declare success
   // ---------------
   cout << "Chain on " + configFile + " PASSED" << endl;
   return 0;
}
